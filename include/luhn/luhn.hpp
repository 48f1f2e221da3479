// include/luhn/luhn.hpp - Umbrella header that exposes luhnlib components.

#pragma once

// Users should generally include only this file.

#include <luhn/core/errors.hpp>
#include <luhn/core/luhn.hpp>
#include <luhn/util/debug.hpp>

namespace luhn {

    using core::checksum;
    using core::checksum_alnum;
    using core::invalid_input;
    using core::try_checksum;
    using core::try_checksum_alnum;
    using core::try_validate;
    using core::try_validate_alnum;
    using core::validate;
    using core::validate_alnum;

} // namespace luhn
