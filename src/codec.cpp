#include "toolbridge/codec.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace toolbridge {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json parse_document(std::string_view raw) {
    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    try {
        auto val = doc.get_value();
        if (val.error()) {
            throw ParseError("Failed to get document value");
        }
        nlohmann::json j = simdjson_to_nlohmann(val.value());
        // Trailing garbage after the first value is not a valid frame.
        if (!doc.at_end()) {
            throw ParseError("Trailing content after JSON value");
        }
        return j;
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(std::string("JSON conversion error: ") + e.what());
    }
}

RequestId read_id(const nlohmann::json& j) {
    RequestId id;
    try {
        from_json(j, id);
    } catch (const std::exception& e) {
        throw ParseError(e.what());
    }
    return id;
}

std::string read_method(const nlohmann::json& j) {
    const auto& m = j.at("method");
    if (!m.is_string()) {
        throw ParseError("'method' must be a string");
    }
    return m.get<std::string>();
}

constexpr std::string_view kWhitespace = " \t\r\n";

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    // 'jsonrpc' may be omitted by worker processes, but a wrong version is rejected.
    if (j.contains("jsonrpc")) {
        const auto& v = j.at("jsonrpc");
        if (!v.is_string() || v.get<std::string>() != JSONRPC_VERSION) {
            throw ParseError("Invalid jsonrpc version, expected '2.0'");
        }
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    if (has_method && has_id) {
        if (j.at("id").is_null()) {
            throw ParseError("Request ID must not be null");
        }
        JsonRpcRequest req;
        req.id = read_id(j.at("id"));
        req.method = read_method(j);
        if (j.contains("params")) req.params = j.at("params");
        return req;
    } else if (has_method && !has_id) {
        JsonRpcNotification notif;
        notif.method = read_method(j);
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    } else if (has_id && !has_method) {
        bool has_result = j.contains("result");
        bool has_error = j.contains("error");
        if (!has_result && !has_error) {
            throw ParseError("Response must carry 'result' or 'error'");
        }
        JsonRpcResponse resp;
        resp.id = read_id(j.at("id"));
        if (has_result) resp.result = j.at("result");
        if (has_error) {
            const auto& e = j.at("error");
            if (!e.is_object() || !e.contains("code") || !e.at("code").is_number_integer()) {
                throw ParseError("Malformed 'error' object");
            }
            resp.error = e.get<JsonRpcError>();
        }
        return resp;
    } else {
        throw ParseError("Cannot determine message type: missing both 'id' and 'method'");
    }
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    nlohmann::json j = parse_document(raw);
    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }

    try {
        return parse_object(j);
    } catch (const ParseError&) {
        throw;
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(std::string("Malformed message: ") + e.what());
    }
}

std::vector<JsonRpcMessage> Codec::parse_batch(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    nlohmann::json j = parse_document(raw);
    if (!j.is_array()) {
        throw ParseError("Batch must be a JSON array");
    }

    std::vector<JsonRpcMessage> messages;
    messages.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_object()) {
            throw ParseError("Each batch item must be a JSON object");
        }
        try {
            messages.push_back(parse_object(item));
        } catch (const nlohmann::json::exception& e) {
            throw ParseError(std::string("Malformed message: ") + e.what());
        }
    }
    return messages;
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Invalid UTF-8 in payload strings is replaced rather than aborting the frame.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Codec::serialize_batch(const std::vector<JsonRpcMessage>& msgs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& msg : msgs) {
        nlohmann::json j;
        to_json(j, msg);
        arr.push_back(std::move(j));
    }
    return arr.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Codec::encode(const JsonRpcMessage& msg) {
    std::string line = serialize(msg);
    line += '\n';
    return line;
}

// ---------- FrameDecoder ----------

FrameDecoder::FrameDecoder(size_t max_line_length)
    : max_line_length_(max_line_length) {}

void FrameDecoder::feed(std::string_view chunk) {
    buffer_.append(chunk.data(), chunk.size());
}

void FrameDecoder::reset() {
    buffer_.clear();
    pos_ = 0;
    discarding_ = false;
}

void FrameDecoder::compact() {
    if (pos_ == 0) return;
    buffer_.erase(0, pos_);
    pos_ = 0;
}

std::optional<DecodeEvent> FrameDecoder::next() {
    while (true) {
        size_t nl = buffer_.find('\n', pos_);
        if (nl == std::string::npos) {
            compact();
            if (buffer_.size() > max_line_length_) {
                // Drop the fragment and everything up to the next newline.
                size_t dropped = buffer_.size();
                buffer_.clear();
                bool already_discarding = discarding_;
                discarding_ = true;
                if (already_discarding) return std::nullopt;
                return DecodeEvent{DecodeError{
                    std::string{},
                    "Line exceeds " + std::to_string(max_line_length_) +
                        " bytes (" + std::to_string(dropped) + " buffered)"}};
            }
            return std::nullopt;
        }

        std::string_view view(buffer_.data() + pos_, nl - pos_);
        pos_ = nl + 1;

        if (discarding_) {
            discarding_ = false;
            continue;
        }

        size_t first = view.find_first_not_of(kWhitespace);
        if (first == std::string_view::npos) continue;
        size_t last = view.find_last_not_of(kWhitespace);
        std::string_view line = view.substr(first, last - first + 1);

        try {
            return DecodeEvent{Codec::parse(line)};
        } catch (const ParseError& e) {
            return DecodeEvent{DecodeError{std::string(line), e.what()}};
        }
    }
}

} // namespace toolbridge
