/**
 * @file json_codec.cpp
 * @brief nlohmann/json based encoding and decoding of API payloads
 */

#include "cavesync/remote_project/http/json_codec.h"

#include <cstdlib>
#include <sstream>

#include <nlohmann/json.hpp>

namespace cavesync::remote_project::json_codec {

using nlohmann::json;

namespace {

auto parse(std::string_view body) -> std::optional<json> {
    auto parsed = json::parse(body.begin(), body.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

auto invalid(std::string message) -> error {
    return error{error_code::invalid_response, std::move(message)};
}

auto unwrap_data(const json& doc) -> const json& {
    if (doc.is_object()) {
        auto it = doc.find("data");
        if (it != doc.end()) {
            return *it;
        }
    }
    return doc;
}

auto string_field(const json& obj, const char* key) -> std::string {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return {};
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

auto optional_string_field(const json& obj, const char* key) -> std::optional<std::string> {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

auto coordinate_field(const json& obj, const char* key) -> std::optional<double> {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        return it->get<double>();
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        if (text.empty()) {
            return std::nullopt;
        }
        char* end = nullptr;
        double value = std::strtod(text.c_str(), &end);
        if (end != nullptr && *end == '\0') {
            return value;
        }
    }
    return std::nullopt;
}

auto format_coordinate(double value) -> std::string {
    std::ostringstream oss;
    oss.precision(10);
    oss << value;
    return oss.str();
}

auto project_from_json(const json& obj) -> result<project> {
    if (!obj.is_object()) {
        return unexpected{invalid("Project entry is not a JSON object")};
    }

    project p;
    p.id = string_field(obj, "id");
    if (p.id.empty()) {
        return unexpected{invalid("Project entry has no id")};
    }
    p.name = string_field(obj, "name");
    p.description = string_field(obj, "description");
    p.country_code = string_field(obj, "country");
    p.latitude = coordinate_field(obj, "latitude");
    p.longitude = coordinate_field(obj, "longitude");
    p.modified_date = string_field(obj, "modified_date");
    p.creation_date = string_field(obj, "creation_date");
    p.permission = parse_access_level(string_field(obj, "permission"));

    auto mutex = obj.find("active_mutex");
    if (mutex != obj.end() && mutex->is_object()) {
        mutex_info info;
        info.user = optional_string_field(*mutex, "user");
        info.creation_date = optional_string_field(*mutex, "creation_date");
        p.active_mutex = std::move(info);
    }

    return p;
}

}  // namespace

auto encode_login(const password_credentials& creds) -> std::string {
    json body;
    body["email"] = creds.email;
    body["password"] = creds.password;
    return body.dump();
}

auto encode_project_request(const project_creation_request& request) -> std::string {
    json body;
    body["name"] = request.name;
    body["description"] = request.description;
    body["country"] = request.country_code;
    if (request.latitude) {
        body["latitude"] = format_coordinate(*request.latitude);
    }
    if (request.longitude) {
        body["longitude"] = format_coordinate(*request.longitude);
    }
    return body.dump();
}

auto decode_token(std::string_view body) -> result<std::string> {
    auto doc = parse(body);
    if (!doc) {
        return unexpected{invalid("Auth response is not valid JSON")};
    }

    const auto& payload = unwrap_data(*doc);
    if (payload.is_object()) {
        auto it = payload.find("token");
        if (it != payload.end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
            return it->get<std::string>();
        }
    }
    return unexpected{invalid("Auth response has no token")};
}

auto decode_project(std::string_view body) -> result<project> {
    auto doc = parse(body);
    if (!doc) {
        return unexpected{invalid("Project response is not valid JSON")};
    }
    return project_from_json(unwrap_data(*doc));
}

auto decode_project_list(std::string_view body) -> result<std::vector<project>> {
    auto doc = parse(body);
    if (!doc) {
        return unexpected{invalid("Project list response is not valid JSON")};
    }

    const auto& payload = unwrap_data(*doc);
    if (!payload.is_array()) {
        return unexpected{invalid("Project list response is not an array")};
    }

    std::vector<project> projects;
    projects.reserve(payload.size());
    for (const auto& entry : payload) {
        auto parsed = project_from_json(entry);
        if (!parsed) {
            return unexpected{parsed.error()};
        }
        projects.push_back(std::move(parsed.value()));
    }
    return projects;
}

auto extract_error_message(std::string_view body) -> std::optional<std::string> {
    auto doc = parse(body);
    if (!doc || !doc->is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"error", "detail", "message"}) {
        auto value = optional_string_field(*doc, key);
        if (value && !value->empty()) {
            return value;
        }
    }
    return std::nullopt;
}

auto status_error(error_code code,
                  int status_code,
                  std::string_view body,
                  std::string_view what) -> error {
    std::string message = std::string(what) + " (HTTP " + std::to_string(status_code) + ")";
    if (auto server_text = extract_error_message(body)) {
        message += ": " + *server_text;
    }
    return error{code, std::move(message), status_code};
}

}  // namespace cavesync::remote_project::json_codec
