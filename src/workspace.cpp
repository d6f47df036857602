#include "ripple/workspace.hpp"

#include "ripple/error.hpp"
#include "ripple/format.hpp"
#include "ripple/log.hpp"

#include <glaze/glaze.hpp>

extern "C" {
#include <fnmatch.h>
}

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

using namespace ripple::literals;

namespace ripple::workspace {

    namespace detail {
        namespace fs = std::filesystem;

        struct manifest_unit {
            std::optional<std::string> id{};
            std::optional<std::string> name{};
            std::optional<std::string> language{};
            std::optional<std::string> directory{};
            std::vector<std::string> documents{};
            std::vector<std::string> references{};
            struct glaze {
                using T = manifest_unit;
                static constexpr auto value =
                        glz::object(&T::id, &T::name, &T::language, &T::directory, &T::documents, &T::references);
            };
        };

        struct manifest {
            std::string name{};
            std::vector<manifest_unit> units{};
            struct glaze {
                using T = manifest;
                static constexpr auto value = glz::object(&T::name, &T::units);
            };
        };

        static std::string read_text(const fs::path& path) {
            std::ifstream in{path, std::ios::binary};
            if (!in) {
                throw error{error_kind::workspace_load, "cannot open workspace manifest: {}"_format(path.string())};
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            return ss.str();
        }

        static std::vector<fs::path> scan_directory(const fs::path& dir, const std::vector<std::string>& patterns) {
            std::vector<fs::path> found{};
            std::error_code ec{};
            if (!fs::is_directory(dir, ec)) {
                throw error{error_kind::workspace_load, "unit directory does not exist: {}"_format(dir.string())};
            }
            auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
            if (ec) {
                throw error{
                        error_kind::workspace_load,
                        "cannot scan unit directory {}: {}"_format(dir.string(), ec.message())};
            }
            for (; !ec && it != fs::recursive_directory_iterator{}; it.increment(ec)) {
                std::error_code entry_ec{};
                if (it->is_regular_file(entry_ec) && matches_patterns(it->path(), patterns)) {
                    found.push_back(normalize_path(it->path()));
                }
            }
            if (ec) {
                throw error{
                        error_kind::workspace_load,
                        "cannot scan unit directory {}: {}"_format(dir.string(), ec.message())};
            }
            // directory iteration order is unspecified
            std::ranges::sort(found);
            return found;
        }

    }  // namespace detail

    std::filesystem::path normalize_path(const std::filesystem::path& path) {
        std::error_code ec{};
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec) {
            return path.lexically_normal();
        }
        auto canonical = std::filesystem::weakly_canonical(absolute, ec);
        if (ec) {
            return absolute.lexically_normal();
        }
        return canonical;
    }

    bool matches_patterns(const std::filesystem::path& path, const std::vector<std::string>& patterns) {
        if (patterns.empty()) {
            return true;
        }
        auto name = path.filename().string();
        return std::ranges::any_of(
                patterns, [&](const std::string& pattern) { return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0; });
    }

    workspace_snapshot::workspace_snapshot(
            std::string name, std::filesystem::path source, std::vector<unit_descriptor> units)
            : name_{std::move(name)}, source_{std::move(source)}, units_{std::move(units)} {
        for (std::size_t i = 0; i < units_.size(); ++i) {
            if (!by_id_.emplace(units_[i].id, i).second) {
                throw error{error_kind::workspace_load, "duplicate unit id: {}"_format(units_[i].id)};
            }
            for (const auto& doc : units_[i].documents) {
                auto& owners = by_document_[normalize_path(doc).string()];
                if (owners.empty() || owners.back() != i) {
                    owners.push_back(i);
                }
            }
        }
    }

    std::filesystem::path workspace_snapshot::root() const {
        if (source_.has_filename() && source_.has_extension()) {
            return source_.parent_path();
        }
        return source_;
    }

    const unit_descriptor* workspace_snapshot::find(std::string_view id) const {
        if (auto it = by_id_.find(std::string{id}); it != by_id_.end()) {
            return &units_[it->second];
        }
        return nullptr;
    }

    std::vector<std::string> workspace_snapshot::units_containing(const std::filesystem::path& file) const {
        std::vector<std::string> owners{};
        if (auto it = by_document_.find(normalize_path(file).string()); it != by_document_.end()) {
            owners.reserve(it->second.size());
            for (auto index : it->second) {
                owners.push_back(units_[index].id);
            }
        }
        return owners;
    }

    std::size_t workspace_snapshot::document_count() const {
        std::size_t count{};
        for (const auto& unit : units_) {
            count += unit.documents.size();
        }
        return count;
    }

    manifest_loader::manifest_loader(std::vector<std::string> patterns) : patterns_{std::move(patterns)} {}

    std::filesystem::path manifest_loader::resolve_manifest(const std::filesystem::path& path) {
        std::error_code ec{};
        if (std::filesystem::is_directory(path, ec)) {
            return normalize_path(path / manifest_file_name);
        }
        return normalize_path(path);
    }

    snapshot_ptr manifest_loader::load(const std::filesystem::path& path) const {
        auto manifest_path = resolve_manifest(path);
        auto text = detail::read_text(manifest_path);

        detail::manifest parsed{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(parsed, text)) {
            throw error{
                    error_kind::workspace_load,
                    "invalid workspace manifest {}: {}"_format(manifest_path.string(), glz::format_error(ec, text))};
        }

        auto base = manifest_path.parent_path();
        std::vector<unit_descriptor> units{};
        units.reserve(parsed.units.size());

        for (auto& entry : parsed.units) {
            unit_descriptor unit{};
            if (entry.id && !entry.id->empty()) {
                unit.id = *entry.id;
            }
            else if (entry.name && !entry.name->empty()) {
                unit.id = *entry.name;
            }
            else {
                throw error{
                        error_kind::workspace_load,
                        "unit #{} in {} has neither id nor name"_format(units.size() + 1, manifest_path.string())};
            }
            unit.name = entry.name.value_or(unit.id);
            unit.language = entry.language.value_or("c++");

            if (entry.directory) {
                unit.documents = detail::scan_directory(base / *entry.directory, patterns_);
            }
            for (const auto& doc : entry.documents) {
                auto resolved = normalize_path(base / doc);
                if (std::ranges::find(unit.documents, resolved) == unit.documents.end()) {
                    unit.documents.push_back(std::move(resolved));
                }
            }
            unit.references = std::move(entry.references);
            units.push_back(std::move(unit));
        }

        auto name = parsed.name.empty() ? base.filename().string() : parsed.name;
        auto snapshot = std::make_shared<const workspace_snapshot>(std::move(name), manifest_path, std::move(units));

        log_info(
                "loaded workspace '",
                snapshot->name(),
                "' from ",
                manifest_path.string(),
                ": ",
                snapshot->units().size(),
                " units, ",
                snapshot->document_count(),
                " documents");
        return snapshot;
    }

}  // namespace ripple::workspace
