/*
 * Part of the dmart-cpp project.
 *
 * SPDX-FileCopyrightText: 2025 dmart-cpp contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of dmart-cpp. See LICENSE for details.
 */

#pragma once
#include <string>

namespace dmart {

enum class Status {
    Success,
    Failed
};

enum class RequestType {
    Create,
    Update,
    Patch,
    UpdateAcl,
    Assign,
    Replace,
    Delete,
    Move
};

enum class ResourceType {
    User,
    Group,
    Folder,
    Schema,
    Content,
    Acl,
    Comment,
    Media,
    DataAsset,
    Locator,
    Relationship,
    Alteration,
    History,
    Space,
    Branch,
    Permission,
    Role,
    Ticket,
    Json,
    Lock,
    Post,
    Reaction,
    Reply,
    Share,
    PluginWrapper,
    Notification,
    Csv,
    Jsonl,
    Sqlite,
    Duckdb,
    Parquet
};

enum class RequestMethod {
    Get,
    Post,
    Delete,
    Put,
    Patch
};

enum class QueryType {
    Search,
    Subpath,
    Events,
    History,
    Tags,
    Spaces,
    Counters,
    Reports,
    Aggregation,
    Attachments,
    AttachmentsAggregation
};

enum class SortType {
    Ascending,
    Descending
};

// Wire names ("success", "update_acl", "data_asset", ...).
const char* to_string(Status v);
const char* to_string(RequestType v);
const char* to_string(ResourceType v);
const char* to_string(QueryType v);
const char* to_string(SortType v);

// HTTP verb in upper case ("GET", "POST", ...).
const char* to_string(RequestMethod v);

// Reverse lookups; throw std::invalid_argument on an unknown name.
Status       status_from_string(const std::string& s);
RequestType  request_type_from_string(const std::string& s);
ResourceType resource_type_from_string(const std::string& s);
QueryType    query_type_from_string(const std::string& s);
SortType     sort_type_from_string(const std::string& s);

} // namespace dmart
