#include "info_json.hpp"
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace {

using JsonWriter = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void emit_string(JsonWriter& writer, const char* key, const std::optional<std::string>& value) {
    if (!value) return;
    writer.Key(key);
    writer.String(value->data(), static_cast<rapidjson::SizeType>(value->size()));
}

void emit_list(JsonWriter& writer, const char* key, const std::vector<std::string>& values) {
    if (values.empty()) return;
    writer.Key(key);
    writer.StartArray();
    for (const auto& value : values) {
        writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
    }
    writer.EndArray();
}

} // namespace

std::string binaryInfoToJson(const BinaryInfo& info)
{
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();
    emit_string(writer, "ProgramName", info.programName);
    emit_string(writer, "ProgramVersion", info.programVersion);
    emit_string(writer, "BuildDate", info.buildDate);
    emit_string(writer, "ProgramURL", info.programUrl);
    emit_string(writer, "ProgramDescription", info.programDescription);
    emit_string(writer, "PicoBoard", info.picoBoard);
    emit_string(writer, "SDKVersion", info.sdkVersion);
    emit_string(writer, "BootStage2Name", info.boot2Name);
    if (info.binaryEnd) {
        writer.Key("BinaryEndAddress");
        writer.Uint(*info.binaryEnd);
    }
    emit_list(writer, "ProgramFeature", info.features);
    emit_list(writer, "ProgramBuildAttribute", info.buildAttributes);

    if (!info.blockDevices.empty()) {
        writer.Key("BlockDevice");
        writer.StartArray();
        for (const auto& device : info.blockDevices) {
            writer.StartObject();
            writer.Key("name");
            writer.String(device.name.data(), static_cast<rapidjson::SizeType>(device.name.size()));
            writer.Key("address");
            writer.Uint(device.address);
            writer.Key("size");
            writer.Uint(device.size);
            writer.Key("flags");
            writer.Uint(device.flags);
            writer.EndObject();
        }
        writer.EndArray();
    }

    if (!info.pins.empty()) {
        writer.Key("Pins");
        writer.StartObject();
        for (const auto& [pin, detail] : info.pins) {
            const std::string key = std::to_string(pin);
            writer.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
            writer.StartObject();
            emit_string(writer, "function", detail.function);
            emit_string(writer, "name", detail.name);
            writer.EndObject();
        }
        writer.EndObject();
    }

    if (!info.namedGroups.empty()) {
        writer.Key("NamedGroup");
        writer.StartArray();
        for (const auto& group : info.namedGroups) {
            writer.StartObject();
            writer.Key("label");
            writer.String(group.label.data(), static_cast<rapidjson::SizeType>(group.label.size()));
            writer.Key("parent");
            writer.Uint(group.parentId);
            writer.Key("flags");
            writer.Uint(group.flags);
            writer.Key("tag");
            writer.Uint(group.tag);
            writer.Key("id");
            writer.Uint(group.groupId);
            writer.EndObject();
        }
        writer.EndArray();
    }
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}
