#include "recdecrypt/metadata.hpp"

#include "recdecrypt/constants.hpp"
#include "recdecrypt/encoding.hpp"
#include "recdecrypt/errors.hpp"
#include "recdecrypt/json.hpp"
#include "recdecrypt/replay.hpp"

#include <limits>
#include <sstream>
#include <utility>

namespace recdecrypt {

namespace {

const json::Value& Require(const json::Value& object, const char* key, const std::string& scope) {
    const json::Value* value = object.Find(key);
    if (!value || value->is_null()) {
        throw MetadataError("missing field: " + scope + key);
    }
    return *value;
}

// Optional fields accept both an absent key and an explicit null.
const json::Value* Optional(const json::Value& object, const char* key) {
    const json::Value* value = object.Find(key);
    if (!value || value->is_null()) {
        return nullptr;
    }
    return value;
}

std::uint32_t ToU32(const json::Value& value, const std::string& field) {
    std::uint64_t wide = value.AsUint64();
    if (wide > std::numeric_limits<std::uint32_t>::max()) {
        throw MetadataError("field out of range: " + field);
    }
    return static_cast<std::uint32_t>(wide);
}

PtyMetadata ParsePty(const json::Value& object) {
    if (object.type() != json::Value::Type::Object) {
        throw MetadataError("pty must be an object");
    }
    PtyMetadata pty;
    if (const json::Value* term = Optional(object, "term")) {
        pty.term = term->AsString();
    }
    pty.width = ToU32(Require(object, "width", "pty."), "pty.width");
    pty.height = ToU32(Require(object, "height", "pty."), "pty.height");
    const json::Value& modes = Require(object, "modes", "pty.");
    if (modes.type() != json::Value::Type::Array) {
        throw MetadataError("pty.modes must be an array");
    }
    for (const json::Value& entry : modes.items()) {
        if (entry.type() != json::Value::Type::Array || entry.items().size() != 2) {
            throw MetadataError("pty.modes entries must be [name, value] pairs");
        }
        pty.modes.emplace_back(entry.items()[0].AsString(), ToU32(entry.items()[1], "pty.modes"));
    }
    return pty;
}

ExitData ParseExitData(const json::Value& object) {
    if (object.type() != json::Value::Type::Object) {
        throw MetadataError("exit_data must be an object");
    }
    ExitData exit;
    exit.timestamp = Require(object, "timestamp", "exit_data.").AsUint64();
    if (const json::Value* status = Optional(object, "status")) {
        exit.status = ToU32(*status, "exit_data.status");
    }
    if (const json::Value* signal = Optional(object, "signal")) {
        exit.signal = signal->AsString();
    }
    if (const json::Value* core = Optional(object, "core_dumped")) {
        exit.core_dumped = core->AsBool();
    }
    if (const json::Value* error = Optional(object, "error_msg")) {
        exit.error_msg = error->AsString();
    }
    return exit;
}

json::Value OptionalString(const std::optional<std::string>& value) {
    return value ? json::Value::MakeString(*value) : json::Value();
}

}  // namespace

SessionMetadata MetadataFromJson(const std::string& text) {
    try {
        json::Value root = json::Parse(text);
        if (root.type() != json::Value::Type::Object) {
            throw MetadataError("metadata must be a JSON object");
        }
        SessionMetadata meta;
        meta.started_at = Require(root, "started_at", "").AsUint64();
        if (const json::Value* size = Optional(root, "data_size")) {
            meta.data_size = size->AsUint64();
        }
        meta.encapsulated_key = Require(root, "encapsulated_key", "").AsString();
        if (const json::Value* pty = Optional(root, "pty")) {
            meta.pty = ParsePty(*pty);
        }
        if (const json::Value* exit = Optional(root, "exit_data")) {
            meta.exit_data = ParseExitData(*exit);
        }
        return meta;
    } catch (const json::Error& exc) {
        throw MetadataError(std::string("invalid metadata json: ") + exc.what());
    }
}

std::string MetadataToJson(const SessionMetadata& metadata) {
    json::Value root = json::Value::MakeObject();
    root.Set("started_at", json::Value::MakeUint(metadata.started_at));
    root.Set("data_size", json::Value::MakeUint(metadata.data_size));
    root.Set("encapsulated_key", json::Value::MakeString(metadata.encapsulated_key));
    if (metadata.pty) {
        const PtyMetadata& pty = *metadata.pty;
        json::Value node = json::Value::MakeObject();
        node.Set("term", OptionalString(pty.term));
        node.Set("width", json::Value::MakeUint(pty.width));
        node.Set("height", json::Value::MakeUint(pty.height));
        json::Value modes = json::Value::MakeArray();
        for (const auto& mode : pty.modes) {
            json::Value pair = json::Value::MakeArray();
            pair.Push(json::Value::MakeString(mode.first));
            pair.Push(json::Value::MakeUint(mode.second));
            modes.Push(std::move(pair));
        }
        node.Set("modes", std::move(modes));
        root.Set("pty", std::move(node));
    } else {
        root.Set("pty", json::Value());
    }
    if (metadata.exit_data) {
        const ExitData& exit = *metadata.exit_data;
        json::Value node = json::Value::MakeObject();
        node.Set("timestamp", json::Value::MakeUint(exit.timestamp));
        node.Set("status", exit.status ? json::Value::MakeUint(*exit.status) : json::Value());
        node.Set("signal", OptionalString(exit.signal));
        node.Set("core_dumped", json::Value::MakeBool(exit.core_dumped));
        node.Set("error_msg", OptionalString(exit.error_msg));
        root.Set("exit_data", std::move(node));
    } else {
        root.Set("exit_data", json::Value());
    }
    return json::Dump(root);
}

SessionMetadata ReadMetadata(std::istream& input) {
    std::uint8_t prefix[constants::kLengthPrefixLen];
    if (!input.read(reinterpret_cast<char*>(prefix), sizeof(prefix))) {
        throw MetadataError("could not read metadata length");
    }
    std::uint32_t len = (static_cast<std::uint32_t>(prefix[0]) << 24)
                        | (static_cast<std::uint32_t>(prefix[1]) << 16)
                        | (static_cast<std::uint32_t>(prefix[2]) << 8)
                        | static_cast<std::uint32_t>(prefix[3]);
    if (len > constants::kMaxMetadataLen) {
        throw MetadataError("metadata length too large: " + std::to_string(len));
    }
    std::string encoded(len, '\0');
    if (len > 0 && !input.read(encoded.data(), static_cast<std::streamsize>(len))) {
        throw MetadataError("could not read metadata");
    }
    bool ok = false;
    encoding::Bytes raw = encoding::Base64Decode(encoded, &ok);
    if (!ok) {
        throw MetadataError("invalid base64 metadata");
    }
    return MetadataFromJson(std::string(raw.begin(), raw.end()));
}

std::vector<std::uint8_t> EncodeMetadata(const SessionMetadata& metadata) {
    std::string body = MetadataToJson(metadata);
    std::string encoded = encoding::Base64Encode(encoding::Bytes(body.begin(), body.end()));
    if (encoded.size() > constants::kMaxMetadataLen) {
        throw MetadataError("metadata too large");
    }
    std::uint32_t len = static_cast<std::uint32_t>(encoded.size());
    std::vector<std::uint8_t> out;
    out.reserve(constants::kLengthPrefixLen + encoded.size());
    out.push_back(static_cast<std::uint8_t>(len >> 24));
    out.push_back(static_cast<std::uint8_t>(len >> 16));
    out.push_back(static_cast<std::uint8_t>(len >> 8));
    out.push_back(static_cast<std::uint8_t>(len));
    out.insert(out.end(), encoded.begin(), encoded.end());
    return out;
}

std::string FormatMetadata(const SessionMetadata& metadata) {
    std::ostringstream out;
    out << "Started:           " << FormatDate(metadata.started_at) << "\n";
    out << "Data size:         " << metadata.data_size << " bytes\n";
    out << "Encapsulated key:  " << metadata.encapsulated_key << "\n";
    if (metadata.pty) {
        const PtyMetadata& pty = *metadata.pty;
        out << "PTY:               " << pty.term.value_or(std::string(constants::kUnknownTerm))
            << " " << pty.width << "x" << pty.height << "\n";
        out << "Echo:              " << (IsEchoEnabled(pty) ? "on" : "off") << "\n";
        out << "Modes:             " << pty.modes.size() << "\n";
    } else {
        out << "PTY:               none (raw session)\n";
    }
    if (metadata.exit_data) {
        const ExitData& exit = *metadata.exit_data;
        out << "Ended:             " << FormatDate(exit.timestamp) << "\n";
        if (exit.status) {
            out << "Exit status:       " << *exit.status << "\n";
        }
        if (exit.signal) {
            out << "Signal:            " << *exit.signal << "\n";
        }
        if (exit.core_dumped) {
            out << "Core dumped:       yes\n";
        }
        if (exit.error_msg) {
            out << "Error:             " << *exit.error_msg << "\n";
        }
    } else {
        out << "Ended:             no termination data\n";
    }
    return out.str();
}

}  // namespace recdecrypt
