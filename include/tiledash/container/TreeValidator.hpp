#pragma once

#include "tiledash/core/Error.hpp"

namespace tdash {

class Container;

/**
 * @brief Validates the options of a whole container tree
 *
 * Walks every container once in pre-order and checks that non-empty ids
 * are unique and that no container combines a fixed split size with a
 * percentage other than the default. Every problem found is reported in
 * one ConfigurationError.
 */
Status validateTree(const Container& root);

}
