/*
    This file is part of gm wallet (devrpc).

    gm wallet is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 2 of the License, or
    (at your option) any later version.

    gm wallet is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with gm wallet.  If not, see <http://www.gnu.org/licenses/>.

    This program is released under the GPL with the additional exemption
    that compiling, linking, and/or using OpenSSL is allowed.
    You are free to remove this exemption from derived works.
*/

#pragma once
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace gm {

enum class ErrorKind {
    request_parse_failed,
    invalid_request,
    port_binding_failed,
    server_crashed,
    reply_dropped,
    reply_timeout,
    request_cancelled,
    forwarded_request_failed,
    invalid_upstream_url,
    request_missing_params,
    invalid_params,
    config_failed,
};

const char* error_kind_name(ErrorKind kind);

class Error : public std::runtime_error {
    ErrorKind kind_;
    nlohmann::json data_;

public:
    Error(ErrorKind kind, const std::string& msg,
          nlohmann::json data = nullptr)
        : std::runtime_error(msg), kind_(kind), data_(std::move(data)) {}

    ErrorKind kind() const { return kind_; }

    // offending value for envelope errors, null otherwise
    const nlohmann::json& data() const { return data_; }
};

} // namespace gm
