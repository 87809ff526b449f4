/**
 * @file parcelsort.hpp
 * @brief Umbrella header including the classifier and validation APIs.
 */
#pragma once

#include "parcelsort/category.hpp"
#include "parcelsort/classifier.hpp"
#include "parcelsort/format.hpp"
#include "parcelsort/package.hpp"
#include "parcelsort/validation.hpp"
