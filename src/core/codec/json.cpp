#include "wirepool/core/codec/json.hpp"

#include "lcr/json.hpp"


namespace wirepool::core::codec {

void Json::encode(const Message& msg, std::string& out) noexcept {
    out.append("{\"type\":");
    lcr::json::append_quoted(out, msg.type);
    if (msg.timestamp_ms != 0) {
        out.append(",\"timestamp\":");
        lcr::json::append(out, msg.timestamp_ms);
    }
    out.append(",\"data\":");
    if (msg.payload.empty()) {
        out.append("null");
    }
    else if (is_structured_(msg.payload)) {
        out.append(msg.payload);
    }
    else {
        lcr::json::append_quoted(out, msg.payload);
    }
    out.push_back('}');
}


// Object, array, number or boolean JSON text. Strings, null and anything
// that does not parse are carried as a JSON string instead.
bool Json::is_structured_(std::string_view payload) noexcept {
    simdjson::dom::element el;
    if (parser_.parse(payload.data(), payload.size()).get(el)) {
        return false;
    }
    const auto t = el.type();
    return t != simdjson::dom::element_type::STRING &&
           t != simdjson::dom::element_type::NULL_VALUE;
}


Error Json::decode(std::string_view data, Message& out) noexcept {
    simdjson::dom::element root;
    if (parser_.parse(data.data(), data.size()).get(root)) {
        return Error::DecodeError;
    }

    simdjson::dom::object obj;
    if (root.get_object().get(obj)) {
        return Error::DecodeError;
    }

    std::string_view type;
    if (obj["type"].get_string().get(type) == simdjson::SUCCESS) {
        out.type.assign(type);
    }
    else {
        out.type.assign(TYPE_DATA);
    }

    std::uint64_t timestamp = 0;
    if (obj["timestamp"].get_uint64().get(timestamp) != simdjson::SUCCESS) {
        timestamp = 0;
    }
    out.timestamp_ms = timestamp;

    simdjson::dom::element body;
    if (obj["data"].get(body) == simdjson::SUCCESS) {
        std::string_view text;
        if (body.is_null()) {
            out.payload.clear();
        }
        else if (body.get_string().get(text) == simdjson::SUCCESS) {
            out.payload.assign(text);
        }
        else {
            out.payload = simdjson::minify(body);
        }
    }
    else {
        out.payload = simdjson::minify(root);
    }

    return Error::None;
}

} // namespace wirepool::core::codec
