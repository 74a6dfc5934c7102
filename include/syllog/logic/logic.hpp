#pragma once

// syllog::logic — forward-chaining saturation over trait-set relations
//
// Relations pair a frozen premise set with a growing conclusion set.
// Saturation closes the conclusion sets under two rules (premise-subset
// merge, once; cascade, to a fixpoint) and tests a terminal query.

#include "syllog/logic/query.hpp"
#include "syllog/logic/relation.hpp"
#include "syllog/logic/saturation.hpp"
