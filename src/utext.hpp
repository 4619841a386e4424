#pragma once

//┌──────────────────────────────────────────────────────────┐
//│ utext; owned & borrowed UTF-8 text.                      │
//│                                                          │
//│   scalar   - a single unicode scalar value               │
//│   codec    - UTF-8 encode, decode & validation           │
//│   view     - non-owning, immutable UTF-8                 │
//│   buffer   - owned, growable UTF-8 ('text')              │
//│   capacity - growth policy of buffer                     │
//│   number   - parse / to_text                             │
//└──────────────────────────────────────────────────────────┘

#include "config.hpp"
#include "error.hpp"
#include "scalar.hpp"
#include "codec.hpp"
#include "capacity.hpp"
#include "view.hpp"
#include "buffer.hpp"
#include "number.hpp"
