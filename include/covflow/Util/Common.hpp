/*
 * Copyright (c) 2025, Trail of Bits, Inc.
 * All rights reserved.
 *
 * This source code is licensed in accordance with the terms specified in
 * the LICENSE file found in the root directory of this source tree.
 */

#pragma once

namespace covflow {

    // Builds a std::visit callable out of a set of lambdas.
    template< typename... Ts >
    struct overloaded : Ts...
    {
        using Ts::operator()...;
    };

    template< typename... Ts >
    overloaded(Ts...) -> overloaded< Ts... >;

} // namespace covflow
