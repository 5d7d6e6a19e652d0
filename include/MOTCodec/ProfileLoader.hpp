#pragma once
// ProfileLoader.hpp – Parses an XML extension profile and installs it into
// the parameter registries and the content type catalog.
//
//   <Profile name="epg" description="...">
//     <ContentTypes>
//       <ContentType type="7" subtype="0" name="..."/>
//     </ContentTypes>
//     <Parameters scope="header">
//       <Parameter id="0x25" name="ScopeStart" encoding="absolute_time"/>
//     </Parameters>
//   </Profile>

#include "ContentType.hpp"
#include "Errors.hpp"
#include "Parameter.hpp"
#include "ParameterRegistry.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace mot {

// Thrown when the XML is structurally invalid or violates the profile rules.
class ProfileLoadError : public MotError {
public:
    using MotError::MotError;
};

struct ExtensionParameterDef {
    uint8_t           id{0};
    std::string       name;
    ParameterScope    scope{ParameterScope::Header};
    ExtensionEncoding encoding{ExtensionEncoding::Raw};
};

struct Profile {
    std::string                         name;
    std::string                         description;
    std::map<ContentType, std::string>  content_types;
    std::vector<ExtensionParameterDef>  parameters;
};

// Loads a profile from the given XML file path.
// Throws ProfileLoadError on any parse or validation failure.
Profile loadProfile(const std::filesystem::path& xml_path);

// Register a decoder for every profile parameter in the registry of its
// scope and name the profile's content types in `catalog` (may be null).
// Throws ProfileLoadError if a registry does not match its expected scope.
void applyProfile(const Profile& profile,
                  ParameterRegistry& header_params,
                  ParameterRegistry& directory_params,
                  ContentTypeCatalog* catalog = nullptr);

[[nodiscard]] const char* encodingName(ExtensionEncoding encoding) noexcept;

} // namespace mot
