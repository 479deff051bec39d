#ifndef IV_FIT_HPP
#define IV_FIT_HPP

// Include all library headers here
#include "curve_fitter.hpp"
#include "fit_errors.hpp"
#include "goodness_of_fit.hpp"
#include "iv_fit/device_quantities.hpp"
#include "model_functions.hpp"
#include "observation_set.hpp"
#include "random_source.hpp"
#include "synthetic_data.hpp"
#include "uncertainty_propagator.hpp"

// This is the main header file for the iv_fit library
// Include this single header to access all functionality

#endif // IV_FIT_HPP
