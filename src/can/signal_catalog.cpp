// src/can/signal_catalog.cpp
#include "can/signal_catalog.hpp"
#include "utils/logging.hpp"
#include "utils/text.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>

namespace can {

namespace {

// yaml-cpp converts "true"/"1" etc. for us, but a quoted or mistyped value must
// still fail the record rather than silently default.
template <typename T>
std::optional<T> scalar_as(const YAML::Node& node) {
    if (!node || !node.IsScalar())
        return std::nullopt;
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        return std::nullopt;
    }
}

std::optional<ByteOrder> parse_byte_order(const YAML::Node& node) {
    auto s = scalar_as<std::string>(node);
    if (!s)
        return std::nullopt;
    const std::string v = utils::to_lower(*s);
    if (v == "big")
        return ByteOrder::Big;
    if (v == "little")
        return ByteOrder::Little;
    return std::nullopt;
}

std::string describe(const YAML::Node& rec, size_t index) {
    if (rec.IsMap() && rec["id"] && rec["id"].IsScalar())
        return "#" + std::to_string(index) + " (id " + rec["id"].Scalar() + ")";
    return "#" + std::to_string(index);
}

std::optional<SignalDefinition> parse_record(const YAML::Node& rec, size_t index) {
    const std::string where = describe(rec, index);

    if (!rec.IsMap()) {
        LOG_WARN("[CAN] Definition %s is not a map, skipping", where.c_str());
        return std::nullopt;
    }

    SignalDefinition def;

    auto id_str = scalar_as<std::string>(rec["id"]);
    if (!id_str || id_str->empty()) {
        LOG_WARN("[CAN] Definition %s has missing or invalid 'id', skipping", where.c_str());
        return std::nullopt;
    }
    if (!utils::parse_hex_u32(*id_str, def.frame_id)) {
        LOG_WARN("[CAN] Definition %s has non-hex 'id' '%s', skipping",
                 where.c_str(), id_str->c_str());
        return std::nullopt;
    }

    auto name = scalar_as<std::string>(rec["name"]);
    if (!name || name->empty()) {
        LOG_WARN("[CAN] Definition %s has missing or empty 'name', skipping", where.c_str());
        return std::nullopt;
    }
    def.signal_name = *name;

    const YAML::Node parser = rec["parser"];
    if (!parser || !parser.IsMap()) {
        LOG_WARN("[CAN] Definition %s ('%s') has no 'parser' map, skipping",
                 where.c_str(), name->c_str());
        return std::nullopt;
    }

    auto type = scalar_as<std::string>(parser["type"]);
    if (!type || (*type != "scalar" && *type != "simple_scalar")) {
        LOG_WARN("[CAN] Definition %s ('%s') has unsupported parser type '%s', skipping",
                 where.c_str(), name->c_str(), type ? type->c_str() : "");
        return std::nullopt;
    }

    static const char* const kRequired[] = {
        "start_byte", "length_bytes", "scale", "offset", "is_signed", "byte_order"};
    for (const char* key : kRequired) {
        if (!parser[key]) {
            LOG_WARN("[CAN] Definition %s ('%s') is missing parser key '%s', skipping",
                     where.c_str(), name->c_str(), key);
            return std::nullopt;
        }
    }

    auto start = scalar_as<int>(parser["start_byte"]);
    auto length = scalar_as<int>(parser["length_bytes"]);
    auto scale = scalar_as<double>(parser["scale"]);
    auto offset = scalar_as<double>(parser["offset"]);
    auto is_signed = scalar_as<bool>(parser["is_signed"]);
    auto order = parse_byte_order(parser["byte_order"]);

    if (!start || !length || !scale || !offset || !is_signed || !order) {
        LOG_WARN("[CAN] Definition %s ('%s') has a mistyped parser field, skipping",
                 where.c_str(), name->c_str());
        return std::nullopt;
    }
    if (!is_valid_layout(*start, *length)) {
        LOG_WARN("[CAN] Definition %s ('%s') byte range start=%d length=%d exceeds 8 bytes, skipping",
                 where.c_str(), name->c_str(), *start, *length);
        return std::nullopt;
    }

    def.start_byte = *start;
    def.length_bytes = *length;
    def.scale = *scale;
    def.offset = *offset;
    def.is_signed = *is_signed;
    def.byte_order = *order;
    return def;
}

} // namespace

bool is_valid_layout(int start_byte, int length_bytes) {
    return start_byte >= 0 && start_byte <= 7 &&
           length_bytes >= 1 && length_bytes <= 8 &&
           start_byte + length_bytes <= 8;
}

SignalCatalog SignalCatalog::build(const YAML::Node& raw_definitions) {
    SignalCatalog catalog;

    if (!raw_definitions || raw_definitions.IsNull()) {
        LOG_WARN("[CAN] No message definitions configured");
        return catalog;
    }
    if (!raw_definitions.IsSequence()) {
        LOG_ERROR("[CAN] 'message_definitions' is not a list, no signals will be decoded");
        return catalog;
    }

    for (size_t i = 0; i < raw_definitions.size(); ++i) {
        auto def = parse_record(raw_definitions[i], i);
        if (!def)
            continue;
        catalog.add(*def);
        LOG_DEBUG("[CAN] Loaded 0x%X '%s' bytes[%d:%d] scale=%g offset=%g",
                  def->frame_id, def->signal_name.c_str(), def->start_byte,
                  def->start_byte + def->length_bytes, def->scale, def->offset);
    }

    if (catalog.empty()) {
        LOG_WARN("[CAN] No valid message definitions found");
    } else {
        LOG_INFO("[CAN] Loaded %zu signal definitions for %zu frame ids",
                 catalog.signal_count(), catalog.frame_count());
    }
    return catalog;
}

bool SignalCatalog::add(const SignalDefinition& def) {
    if (!is_valid_layout(def.start_byte, def.length_bytes) || def.signal_name.empty())
        return false;
    frames_[def.frame_id].push_back(def);
    ++signal_count_;
    return true;
}

const std::vector<SignalDefinition>* SignalCatalog::find(uint32_t frame_id) const {
    auto it = frames_.find(frame_id);
    if (it == frames_.end())
        return nullptr;
    return &it->second;
}

} // namespace can
