// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026  OtterStax

#pragma once

#include "metadata/types.hpp"

#include <boost/mysql.hpp>

namespace tsl {

    metadata::value_t mysql_to_value(boost::mysql::field_view field);

    // Keeps the labels reported by the server, schema projection happens later.
    metadata::raw_result mysql_to_raw(const boost::mysql::results& result);

} // namespace tsl
