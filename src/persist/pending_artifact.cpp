#include "persist/pending_artifact.hpp"

#include <charconv>
#include <optional>
#include <system_error>

#include "core/snapshot_identity.hpp"
#include "persist/atomic_file.hpp"
#include "persist/header_block.hpp"
#include "persist/snapshot_store.hpp"
#include "util/crc32c.hpp"
#include "util/log.hpp"

namespace persist {
namespace {

constexpr std::string_view kAbsent = "absent";
constexpr std::string_view kOldMarker = "--- old\n";
constexpr std::string_view kNewMarker = "--- new\n";
constexpr std::string_view kDiffMarker = "--- diff\n";

std::uint32_t artifact_checksum(const core::PendingArtifact& a) noexcept {
    std::uint32_t crc = util::Crc32c::initial;
    if (a.old_body) {
        crc = util::Crc32c::update(crc, *a.old_body);
    }
    crc = util::Crc32c::update(crc, a.new_body);
    crc = util::Crc32c::update(crc, a.diff);
    return util::Crc32c::finalize(crc);
}

template <typename T>
bool parse_number(std::string_view s, T& out) noexcept {
    if (s.empty()) {
        return false;
    }
    T v{};
    const auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc() || res.ptr != s.data() + s.size()) {
        return false;
    }
    out = v;
    return true;
}

void append_section(std::string& out, std::string_view marker, std::string_view body) {
    out += marker;
    out += body;
    out += '\n';
}

class SectionReader {
public:
    SectionReader(std::string_view text, std::size_t pos) : text_(text), pos_(pos) {}

    bool take(std::string_view marker, std::size_t len, std::string& out, std::string& err) {
        if (text_.substr(pos_, marker.size()) != marker) {
            err = "Expected section '" + std::string(marker.substr(0, marker.size() - 1)) + "'";
            return false;
        }
        pos_ += marker.size();
        // Room for `len` bytes plus the closing newline, without overflow on
        // a hostile length.
        if (pos_ >= text_.size() || len > text_.size() - pos_ - 1) {
            err = "Section '" + std::string(marker.substr(0, marker.size() - 1)) + "' truncated";
            return false;
        }
        out.assign(text_.substr(pos_, len));
        pos_ += len;
        if (text_[pos_] != '\n') {
            err = "Section '" + std::string(marker.substr(0, marker.size() - 1)) + "' length mismatch";
            return false;
        }
        ++pos_;
        return true;
    }

    bool at_end() const noexcept { return pos_ == text_.size(); }

private:
    std::string_view text_;
    std::size_t pos_;
};

const std::string* require(const HeaderBlock& hdr, std::string_view key, std::string& err) {
    const auto* v = hdr.find(key);
    if (v == nullptr) {
        err = "Missing '" + std::string(key) + "' header";
    }
    return v;
}

} // namespace

std::string encode_pending(const core::PendingArtifact& a) {
    HeaderBlock hdr;
    hdr.magic = std::string(kPendingMagic);
    hdr.add("source", a.test.key());
    hdr.add("module-dir", a.test.module_dir);
    hdr.add("module", a.test.module_id);
    hdr.add("test", a.test.test_name);
    if (a.name) {
        hdr.add("name", *a.name);
    }
    hdr.add("ordinal", std::to_string(a.ordinal));
    hdr.add("format", core::format_name(a.format));
    if (a.description) {
        hdr.add("description", *a.description);
    }
    hdr.add("old", a.old_body ? std::to_string(a.old_body->size()) : std::string(kAbsent));
    hdr.add("new", std::to_string(a.new_body.size()));
    hdr.add("diff", std::to_string(a.diff.size()));
    hdr.add("checksum", util::crc32c_hex(artifact_checksum(a)));

    std::string out = render_header(hdr);
    if (a.old_body) {
        append_section(out, kOldMarker, *a.old_body);
    }
    append_section(out, kNewMarker, a.new_body);
    append_section(out, kDiffMarker, a.diff);
    return out;
}

bool decode_pending(std::string_view text, core::PendingArtifact& out, std::string& err) {
    HeaderBlock hdr;
    std::size_t body_offset = 0;
    if (!parse_header(text, kPendingMagic, hdr, body_offset, err)) {
        return false;
    }
    core::PendingArtifact a;
    const auto* module_dir = require(hdr, "module-dir", err);
    const auto* module = require(hdr, "module", err);
    const auto* test = require(hdr, "test", err);
    const auto* source = require(hdr, "source", err);
    const auto* ordinal = require(hdr, "ordinal", err);
    const auto* format = require(hdr, "format", err);
    const auto* old_len_s = require(hdr, "old", err);
    const auto* new_len_s = require(hdr, "new", err);
    const auto* diff_len_s = require(hdr, "diff", err);
    const auto* checksum = require(hdr, "checksum", err);
    if (!module_dir || !module || !test || !source || !ordinal || !format || !old_len_s || !new_len_s ||
        !diff_len_s || !checksum) {
        return false;
    }
    a.test = core::TestIdentity{*module_dir, *module, *test};
    if (a.test.module_id.empty() || a.test.test_name.empty()) {
        err = "Empty module or test name";
        return false;
    }
    if (*source != a.test.key()) {
        err = "'source' does not match module-dir/module/test";
        return false;
    }
    if (const auto* name = hdr.find("name")) {
        a.name = *name;
    }
    if (const auto* desc = hdr.find("description")) {
        a.description = *desc;
    }
    if (!parse_number(*ordinal, a.ordinal) || a.ordinal == 0) {
        err = "Invalid 'ordinal' header";
        return false;
    }
    const auto fmt = core::format_from_string(*format);
    if (!fmt) {
        err = "Unknown format '" + *format + "'";
        return false;
    }
    a.format = *fmt;

    std::optional<std::size_t> old_len;
    if (*old_len_s != kAbsent) {
        std::size_t n = 0;
        if (!parse_number(*old_len_s, n)) {
            err = "Invalid 'old' length";
            return false;
        }
        old_len = n;
    }
    std::size_t new_len = 0;
    std::size_t diff_len = 0;
    if (!parse_number(*new_len_s, new_len) || !parse_number(*diff_len_s, diff_len)) {
        err = "Invalid 'new' or 'diff' length";
        return false;
    }

    SectionReader sections(text, body_offset);
    if (old_len) {
        std::string old_body;
        if (!sections.take(kOldMarker, *old_len, old_body, err)) {
            return false;
        }
        a.old_body = std::move(old_body);
    }
    if (!sections.take(kNewMarker, new_len, a.new_body, err) ||
        !sections.take(kDiffMarker, diff_len, a.diff, err)) {
        return false;
    }
    if (!sections.at_end()) {
        err = "Trailing bytes after diff section";
        return false;
    }
    const auto expected = util::crc32c_hex(artifact_checksum(a));
    if (*checksum != expected) {
        err = "Checksum mismatch (header " + *checksum + ", computed " + expected + ")";
        return false;
    }
    out = std::move(a);
    return true;
}

bool write_pending(const std::filesystem::path& pending_path,
                   const core::PendingArtifact& artifact,
                   core::EngineError& err) {
    if (!atomic_write(pending_path, encode_pending(artifact), err)) {
        return false;
    }
    SNAPGATE_LOG_INFO("pending snapshot written: %s", pending_path.c_str());
    return true;
}

bool read_pending(const std::filesystem::path& pending_path, core::PendingArtifact& out, core::EngineError& err) {
    std::string raw;
    switch (read_file(pending_path, raw, err)) {
    case ReadStatus::NotFound:
        err.set(core::ErrorKind::UnknownPendingArtifact, "Pending artifact no longer exists", pending_path);
        return false;
    case ReadStatus::Error:
        return false;
    case ReadStatus::Ok:
        break;
    }
    std::string parse_err;
    if (!decode_pending(raw, out, parse_err)) {
        err.set(core::ErrorKind::CorruptPendingArtifact, parse_err, pending_path);
        return false;
    }
    return true;
}

bool promote_pending(const std::filesystem::path& pending_path,
                     const core::PendingArtifact& artifact,
                     core::EngineError& err) {
    const auto accepted = core::accepted_path_for(pending_path);
    if (!accepted) {
        err.set(core::ErrorKind::UnknownPendingArtifact, "Not a pending artifact path", pending_path);
        return false;
    }
    if (!file_exists(pending_path)) {
        err.set(core::ErrorKind::UnknownPendingArtifact, "Pending artifact no longer exists", pending_path);
        return false;
    }
    core::AcceptedSnapshot snap;
    snap.source = artifact.test.key();
    snap.format = artifact.format;
    snap.name = artifact.name;
    snap.description = artifact.description;
    snap.body = artifact.new_body;
    if (!store_next_revision(*accepted, std::move(snap), err)) {
        return false;
    }
    // The accepted file already holds the new body; a failure here leaves a
    // stale pending file that the next run's Pass cleans up.
    if (remove_file(pending_path, err) == RemoveStatus::Error) {
        return false;
    }
    return true;
}

bool discard_pending(const std::filesystem::path& pending_path, core::EngineError& err) {
    switch (remove_file(pending_path, err)) {
    case RemoveStatus::Removed:
        SNAPGATE_LOG_INFO("pending snapshot rejected: %s", pending_path.c_str());
        return true;
    case RemoveStatus::NotFound:
        err.set(core::ErrorKind::UnknownPendingArtifact, "Pending artifact no longer exists", pending_path);
        return false;
    case RemoveStatus::Error:
        return false;
    }
    return false;
}

} // namespace persist
