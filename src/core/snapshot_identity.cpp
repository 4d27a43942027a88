#include "core/snapshot_identity.hpp"

#include <algorithm>

namespace core {

std::string TestIdentity::key() const {
    std::string out;
    if (!module_dir.empty()) {
        out += module_dir;
        out += '/';
    }
    out += module_id;
    out += "::";
    out += test_name;
    return out;
}

std::string extension_for(Format format, std::string_view binary_extension) {
    if (format != Format::Binary) {
        return "snap";
    }
    std::string ext = "snap.";
    ext += binary_extension.empty() ? kDefaultBinaryExtension : binary_extension;
    return ext;
}

bool valid_binary_extension(std::string_view ext) noexcept {
    if (ext.empty() || ext.size() > 16) {
        return false;
    }
    return std::all_of(ext.begin(), ext.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
}

std::string sanitize_name_component(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == ':' && i + 1 < s.size() && s[i + 1] == ':') {
            out += "__";
            ++i;
            continue;
        }
        switch (c) {
            case '/': case '\\': case ':': case '*': case '?':
            case '"': case '<': case '>': case '|': case '\n': case '\r': case '\t':
                out += '_';
                break;
            default:
                out += c;
        }
    }
    return out;
}

std::string snapshot_stem(const SnapshotIdentity& id) {
    std::string stem = sanitize_name_component(id.module_id);
    stem += "__";
    stem += sanitize_name_component(id.test_name);
    if (id.explicit_name) {
        stem += "__";
        stem += sanitize_name_component(*id.explicit_name);
    } else if (id.ordinal > 1) {
        stem += '-';
        stem += std::to_string(id.ordinal);
    }
    return stem;
}

std::filesystem::path resolve_snapshot_path(const SnapshotIdentity& id) {
    std::filesystem::path p = id.workspace_root;
    if (!id.module_dir.empty()) {
        p /= std::filesystem::path(id.module_dir);
    }
    p /= std::string(kSnapshotDirName);
    p /= snapshot_stem(id) + "." + id.extension;
    return p.lexically_normal();
}

std::filesystem::path pending_path_for(const std::filesystem::path& accepted_path) {
    std::filesystem::path p = accepted_path;
    p += std::string(kPendingSuffix);
    return p;
}

std::optional<std::filesystem::path> accepted_path_for(const std::filesystem::path& pending_path) {
    const std::string s = pending_path.string();
    if (s.size() <= kPendingSuffix.size() ||
        s.compare(s.size() - kPendingSuffix.size(), kPendingSuffix.size(), kPendingSuffix) != 0) {
        return std::nullopt;
    }
    return std::filesystem::path(s.substr(0, s.size() - kPendingSuffix.size()));
}

bool parse_test_locator(std::string_view locator, TestIdentity& out, EngineError& err) {
    const auto sep = locator.find("::");
    if (sep == std::string_view::npos) {
        err.set(ErrorKind::InvalidConfig,
                "Expected '::' in test locator (" + std::string(locator) + ")");
        return false;
    }
    const std::filesystem::path file(std::string(locator.substr(0, sep)));
    std::string_view test = locator.substr(sep + 2);
    if (const auto space = test.find(' '); space != std::string_view::npos) {
        test = test.substr(0, space);
    }
    if (file.stem().empty() || test.empty()) {
        err.set(ErrorKind::InvalidConfig,
                "Test locator needs a file and a test name (" + std::string(locator) + ")");
        return false;
    }
    TestIdentity id;
    id.module_dir = file.parent_path().generic_string();
    id.module_id = file.stem().string();
    id.test_name = std::string(test);
    out = std::move(id);
    return true;
}

std::uint32_t OrdinalCounter::next(const std::string& test_key) {
    auto& c = counters_[test_key];
    return ++c;
}

std::uint32_t OrdinalCounter::peek_last(const std::string& test_key) const {
    const auto it = counters_.find(test_key);
    if (it == counters_.end()) {
        return 1;
    }
    return std::max<std::uint32_t>(it->second, 1);
}

std::uint32_t OrdinalCounter::peek_next(const std::string& test_key) const {
    const auto it = counters_.find(test_key);
    return (it == counters_.end() ? 0 : it->second) + 1;
}

void OrdinalCounter::reset(const std::string& test_key) {
    counters_.erase(test_key);
}

} // namespace core
