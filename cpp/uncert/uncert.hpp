// ============================================================================
// Fragment 4.1 - Aggregator Header (Single Include for the uncert Library)
// File: uncert/uncert.hpp
// ============================================================================
//
// Pulls in the whole public surface: numbers with uncertainties, their
// arithmetic, rounding and formatting.
//
// Note: keep this list explicit (no wildcard) for auditability.
//

#pragma once

// Core error + logging + settings
#include "uncert/core/error.hpp"
#include "uncert/core/logging.hpp"
#include "uncert/core/advisory.hpp"
#include "uncert/core/settings.hpp"

// Numeric collaborator
#include "uncert/numeric/safe_math.hpp"
#include "uncert/numeric/values.hpp"
#include "uncert/numeric/reduce.hpp"

// Measurements
#include "uncert/measure/rounding.hpp"
#include "uncert/measure/format.hpp"
#include "uncert/measure/uncertainty.hpp"
#include "uncert/measure/measurement.hpp"
#include "uncert/measure/builder.hpp"
