#pragma once

//┌──────────────────────────────────────────────────────────────┐
//│ UTEXT_CHECKED_BORROWS                                        │
//│                                                              │
//│ 1 -> views remember the generation of the buffer they borrow │
//│      from and refuse to be used once it has been mutated.    │
//│ 0 -> views are a bare (pointer, size) pair.                  │
//└──────────────────────────────────────────────────────────────┘

#ifndef UTEXT_CHECKED_BORROWS
#define UTEXT_CHECKED_BORROWS 1
#endif
