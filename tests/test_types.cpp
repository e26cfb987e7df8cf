/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#include <catch2/catch.hpp>

#include "dmart/types.hpp"

#include <stdexcept>
#include <string>

using namespace dmart;

TEST_CASE("wire names of enums", "[types]") {
    CHECK(std::string(to_string(Status::Failed)) == "failed");
    CHECK(std::string(to_string(RequestType::UpdateAcl)) == "update_acl");
    CHECK(std::string(to_string(ResourceType::DataAsset)) == "data_asset");
    CHECK(std::string(to_string(ResourceType::PluginWrapper)) == "plugin_wrapper");
    CHECK(std::string(to_string(QueryType::AttachmentsAggregation)) == "attachments_aggregation");
    CHECK(std::string(to_string(SortType::Descending)) == "descending");
}

TEST_CASE("HTTP verbs are upper case", "[types]") {
    CHECK(std::string(to_string(RequestMethod::Get)) == "GET");
    CHECK(std::string(to_string(RequestMethod::Put)) == "PUT");
    CHECK(std::string(to_string(RequestMethod::Patch)) == "PATCH");
}

TEST_CASE("reverse lookups", "[types]") {
    CHECK(status_from_string("success") == Status::Success);
    CHECK(request_type_from_string("delete") == RequestType::Delete);
    CHECK(resource_type_from_string("ticket") == ResourceType::Ticket);
    CHECK(query_type_from_string("subpath") == QueryType::Subpath);
    CHECK(sort_type_from_string("ascending") == SortType::Ascending);
}

TEST_CASE("unknown names are rejected", "[types]") {
    CHECK_THROWS_AS(status_from_string("ok"), std::invalid_argument);
    CHECK_THROWS_AS(resource_type_from_string("Content"), std::invalid_argument);
    CHECK_THROWS_AS(request_type_from_string(""), std::invalid_argument);
}
