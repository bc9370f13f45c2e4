#pragma once

// Umbrella header for the wary parsing library.
//
// The Boost.Regex pattern source lives in <wary/regex.hpp> and is not
// included here.

#include "wary/bound.hpp"
#include "wary/display.hpp"
#include "wary/entry.hpp"
#include "wary/error/backtrace.hpp"
#include "wary/error/context.hpp"
#include "wary/error/details.hpp"
#include "wary/error/external.hpp"
#include "wary/error/fatal.hpp"
#include "wary/error/invalid.hpp"
#include "wary/error/invalid_value.hpp"
#include "wary/error/length_shortfall.hpp"
#include "wary/error/retry.hpp"
#include "wary/error/traits.hpp"
#include "wary/error/value.hpp"
#include "wary/error/value_mismatch.hpp"
#include "wary/error/verbose_error.hpp"
#include "wary/expected.hpp"
#include "wary/input.hpp"
#include "wary/maybe_string.hpp"
#include "wary/pattern.hpp"
#include "wary/prefix.hpp"
#include "wary/reader.hpp"
#include "wary/span.hpp"
