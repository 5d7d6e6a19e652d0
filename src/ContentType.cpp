// ContentType.cpp – Content type formatting and the well-known catalog.

#include "MOTCodec/ContentType.hpp"

#include <fmt/format.h>

namespace mot {

std::string toString(ContentType ct) {
    return fmt::format("[{}:{}]", ct.type, ct.subtype);
}

ContentTypeCatalog ContentTypeCatalog::wellKnown() {
    using namespace content_types;

    ContentTypeCatalog c;
    c.add(GeneralObjectTransfer, "general object transfer");
    c.add(GeneralMimeHttp,       "MIME/HTTP");

    c.add(TextAscii, "text/ASCII");
    c.add(TextIso,   "text/ISO");
    c.add(TextHtml,  "text/HTML");

    c.add(ImageGif,  "image/GIF");
    c.add(ImageJfif, "image/JFIF");
    c.add(ImageBmp,  "image/BMP");
    c.add(ImagePng,  "image/PNG");

    c.add(AudioMpeg1Layer1, "audio/MPEG-1 layer I");
    c.add(AudioMpeg1Layer2, "audio/MPEG-1 layer II");
    c.add(AudioMpeg1Layer3, "audio/MPEG-1 layer III");
    c.add(AudioMpeg2Layer1, "audio/MPEG-2 layer I");
    c.add(AudioMpeg2Layer2, "audio/MPEG-2 layer II");
    c.add(AudioMpeg2Layer3, "audio/MPEG-2 layer III");
    c.add(AudioPcm,         "audio/PCM");
    c.add(AudioAiff,        "audio/AIFF");
    c.add(AudioAtrac,       "audio/ATRAC");
    c.add(AudioAtrac2,      "audio/ATRAC-2");
    c.add(AudioMpeg4,       "audio/MPEG-4");

    c.add(VideoMpeg1, "video/MPEG-1");
    c.add(VideoMpeg2, "video/MPEG-2");
    c.add(VideoMpeg4, "video/MPEG-4");
    c.add(VideoH263,  "video/H.263");

    c.add(MotHeaderUpdate, "MOT header update");

    c.add(SystemMheg, "system/MHEG");
    c.add(SystemJava, "system/Java");
    return c;
}

void ContentTypeCatalog::add(ContentType ct, std::string name) {
    names_[ct] = std::move(name);
}

std::string_view ContentTypeCatalog::name(ContentType ct) const {
    auto it = names_.find(ct);
    if (it == names_.end()) return {};
    return it->second;
}

std::string ContentTypeCatalog::describe(ContentType ct) const {
    auto it = names_.find(ct);
    if (it == names_.end()) return toString(ct);
    return it->second + " " + toString(ct);
}

} // namespace mot
