#include "persist/snapshot_store.hpp"

#include <charconv>
#include <system_error>

#include "persist/atomic_file.hpp"
#include "persist/header_block.hpp"
#include "util/log.hpp"

namespace persist {
namespace {

bool parse_revision(std::string_view s, std::uint32_t& out) noexcept {
    if (s.empty()) {
        return false;
    }
    std::uint32_t v = 0;
    const auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size() || v == 0) {
        return false;
    }
    out = v;
    return true;
}

} // namespace

std::string encode_accepted(const core::AcceptedSnapshot& snap) {
    HeaderBlock hdr;
    hdr.magic = std::string(kAcceptedMagic);
    hdr.add("source", snap.source);
    hdr.add("format", core::format_name(snap.format));
    hdr.add("revision", std::to_string(snap.revision));
    if (snap.name) {
        hdr.add("name", *snap.name);
    }
    if (snap.description) {
        hdr.add("description", *snap.description);
    }
    std::string out = render_header(hdr);
    out += snap.body;
    return out;
}

bool decode_accepted(std::string_view text, core::AcceptedSnapshot& out, std::string& err) {
    HeaderBlock hdr;
    std::size_t body_offset = 0;
    if (!parse_header(text, kAcceptedMagic, hdr, body_offset, err)) {
        return false;
    }
    core::AcceptedSnapshot snap;
    const auto* source = hdr.find("source");
    if (source == nullptr || source->empty()) {
        err = "Missing 'source' header";
        return false;
    }
    snap.source = *source;

    const auto* fmt = hdr.find("format");
    if (fmt == nullptr) {
        err = "Missing 'format' header";
        return false;
    }
    const auto parsed_fmt = core::format_from_string(*fmt);
    if (!parsed_fmt) {
        err = "Unknown format '" + *fmt + "'";
        return false;
    }
    snap.format = *parsed_fmt;

    const auto* rev = hdr.find("revision");
    if (rev == nullptr || !parse_revision(*rev, snap.revision)) {
        err = "Missing or invalid 'revision' header";
        return false;
    }
    if (const auto* name = hdr.find("name")) {
        snap.name = *name;
    }
    if (const auto* desc = hdr.find("description")) {
        snap.description = *desc;
    }
    for (const auto& [k, v] : hdr.fields) {
        if (k != "source" && k != "format" && k != "revision" && k != "name" && k != "description") {
            err = "Unknown header key '" + k + "'";
            return false;
        }
    }
    snap.body = std::string(text.substr(body_offset));
    out = std::move(snap);
    return true;
}

bool read_accepted(const std::filesystem::path& path,
                   std::optional<core::AcceptedSnapshot>& out,
                   core::EngineError& err) {
    out.reset();
    std::string raw;
    switch (read_file(path, raw, err)) {
    case ReadStatus::NotFound:
        return true;
    case ReadStatus::Error:
        return false;
    case ReadStatus::Ok:
        break;
    }
    core::AcceptedSnapshot snap;
    std::string parse_err;
    if (!decode_accepted(raw, snap, parse_err)) {
        err.set(core::ErrorKind::CorruptAcceptedFile, parse_err, path);
        return false;
    }
    out = std::move(snap);
    return true;
}

bool write_accepted(const std::filesystem::path& path, const core::AcceptedSnapshot& snap, core::EngineError& err) {
    return atomic_write(path, encode_accepted(snap), err);
}

bool store_next_revision(const std::filesystem::path& path, core::AcceptedSnapshot snap, core::EngineError& err) {
    std::optional<core::AcceptedSnapshot> existing;
    core::EngineError read_err;
    snap.revision = 1;
    if (read_accepted(path, existing, read_err)) {
        if (existing) {
            snap.revision = existing->revision + 1;
        }
    } else if (read_err.kind == core::ErrorKind::CorruptAcceptedFile) {
        SNAPGATE_LOG_WARN("replacing unreadable accepted snapshot %s (%s); revision restarts at 1",
                          path.c_str(), read_err.message.c_str());
    } else {
        err = std::move(read_err);
        return false;
    }
    if (!write_accepted(path, snap, err)) {
        return false;
    }
    SNAPGATE_LOG_INFO("accepted %s (revision %u)", path.c_str(), static_cast<unsigned>(snap.revision));
    return true;
}

} // namespace persist
