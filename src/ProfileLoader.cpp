// ProfileLoader.cpp – Parses MOT extension profiles with pugixml.

#include "MOTCodec/ProfileLoader.hpp"
#include "MOTCodec/Log.hpp"
#include "MOTCodec/ParameterCodec.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <cstring>
#include <set>
#include <string>

namespace mot {

// ─── Small parsing helpers ────────────────────────────────────────────────────

// Decimal, or hexadecimal with a 0x prefix.
static uint64_t parseU64(const char* s, const char* ctx) {
    const char* begin = s;
    int base = 10;
    if (begin[0] == '0' && (begin[1] == 'x' || begin[1] == 'X')) {
        begin += 2;
        base   = 16;
    }
    const char* end = s + std::strlen(s);
    uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(begin, end, v, base);
    if (ec != std::errc{} || ptr != end || begin == end)
        throw ProfileLoadError(std::string(ctx) + ": cannot parse uint '" + s + "'");
    return v;
}

static ExtensionEncoding parseEncoding(const char* s) {
    if (!s || *s == '\0')                  return ExtensionEncoding::Raw;
    if (strcmp(s, "raw")           == 0) return ExtensionEncoding::Raw;
    if (strcmp(s, "string")        == 0) return ExtensionEncoding::String;
    if (strcmp(s, "uint8")         == 0) return ExtensionEncoding::UInt8;
    if (strcmp(s, "absolute_time") == 0) return ExtensionEncoding::AbsoluteTime;
    if (strcmp(s, "relative_time") == 0) return ExtensionEncoding::RelativeTime;
    throw ProfileLoadError(std::string("Unknown encoding: '") + s + "'");
}

static ParameterScope parseScope(const char* s) {
    if (!s || strcmp(s, "header")  == 0) return ParameterScope::Header;
    if (strcmp(s, "directory")         == 0) return ParameterScope::Directory;
    throw ProfileLoadError(std::string("Unknown parameter scope: '") + s + "'");
}

// ─── <ContentTypes> ───────────────────────────────────────────────────────────

static void parseContentTypes(pugi::xml_node node, Profile& profile) {
    for (auto ct_node : node.children("ContentType")) {
        uint64_t type    = parseU64(ct_node.attribute("type").as_string(""), "ContentType.type");
        uint64_t subtype = parseU64(ct_node.attribute("subtype").as_string(""), "ContentType.subtype");
        if (type > 0x3F || subtype > 0x1FF)
            throw ProfileLoadError("ContentType " + std::to_string(type) + ":" +
                                   std::to_string(subtype) + " does not fit 6/9 bits");

        std::string name = ct_node.attribute("name").as_string("");
        if (name.empty())
            throw ProfileLoadError("<ContentType> missing 'name' attribute");

        ContentType ct{static_cast<uint8_t>(type), static_cast<uint16_t>(subtype)};
        profile.content_types[ct] = std::move(name);
    }
}

// ─── <Parameters scope="..."> ─────────────────────────────────────────────────

static void parseParameters(pugi::xml_node node, Profile& profile) {
    const ParameterScope scope = parseScope(node.attribute("scope").as_string("header"));

    for (auto p_node : node.children("Parameter")) {
        ExtensionParameterDef def;
        uint64_t id  = parseU64(p_node.attribute("id").as_string(""), "Parameter.id");
        if (id > kMaxParameterId)
            throw ProfileLoadError("Parameter id " + std::to_string(id) + " exceeds 63");
        def.id       = static_cast<uint8_t>(id);
        def.name     = p_node.attribute("name").as_string("");
        def.scope    = scope;
        def.encoding = parseEncoding(p_node.attribute("encoding").as_string("raw"));

        if (def.name.empty())
            throw ProfileLoadError("Parameter " + std::to_string(id) + " has no name");

        profile.parameters.push_back(std::move(def));
    }
}

// ─── Public entry points ──────────────────────────────────────────────────────

Profile loadProfile(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw ProfileLoadError("Failed to parse XML '" + xml_path.string() +
                               "': " + result.description());

    pugi::xml_node root = doc.child("Profile");
    if (!root)
        throw ProfileLoadError("XML root element must be <Profile>");

    Profile profile;
    profile.name        = root.attribute("name").as_string("");
    profile.description = root.attribute("description").as_string("");
    if (profile.name.empty())
        throw ProfileLoadError("<Profile name=\"...\"> is missing or empty");

    if (auto cts = root.child("ContentTypes"))
        parseContentTypes(cts, profile);

    for (auto params : root.children("Parameters"))
        parseParameters(params, profile);

    // One definition per (scope, id).
    std::set<std::pair<ParameterScope, uint8_t>> seen;
    for (const auto& def : profile.parameters) {
        if (!seen.emplace(def.scope, def.id).second)
            throw ProfileLoadError("Profile '" + profile.name + "' defines parameter " +
                                   std::to_string(def.id) + " twice in one scope");
    }

    logInfo("loaded profile '{}': {} parameters, {} content types", profile.name,
            profile.parameters.size(), profile.content_types.size());
    return profile;
}

void applyProfile(const Profile& profile,
                  ParameterRegistry& header_params,
                  ParameterRegistry& directory_params,
                  ContentTypeCatalog* catalog) {
    if (header_params.scope() != ParameterScope::Header ||
        directory_params.scope() != ParameterScope::Directory)
        throw ProfileLoadError("applyProfile: registries passed in the wrong order");

    for (const auto& def : profile.parameters) {
        ParameterRegistry& registry =
            def.scope == ParameterScope::Header ? header_params : directory_params;
        if (registry.contains(def.id))
            logWarning("profile '{}': parameter {} ({}) replaces an existing decoder",
                       profile.name, def.id, def.name);

        registry.registerDecoder(def.id, [def](std::span<const uint8_t> data) -> Parameter {
            return makeExtensionParameter(def.id, def.name, def.scope, def.encoding, data);
        });
        logDebug("profile '{}': registered {} as parameter {} ({})", profile.name,
                 def.name, def.id, encodingName(def.encoding));
    }

    if (catalog != nullptr) {
        for (const auto& [ct, name] : profile.content_types) catalog->add(ct, name);
    }
}

const char* encodingName(ExtensionEncoding encoding) noexcept {
    switch (encoding) {
    case ExtensionEncoding::Raw:          return "raw";
    case ExtensionEncoding::String:       return "string";
    case ExtensionEncoding::UInt8:        return "uint8";
    case ExtensionEncoding::AbsoluteTime: return "absolute_time";
    case ExtensionEncoding::RelativeTime: return "relative_time";
    }
    return "?";
}

} // namespace mot
