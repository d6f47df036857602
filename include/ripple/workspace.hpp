#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ripple::workspace {

    // A buildable grouping of source documents; `references` are ids of other units it depends on
    struct unit_descriptor {
        std::string id{};
        std::string name{};
        std::string language{};
        std::vector<std::filesystem::path> documents{};
        std::vector<std::string> references{};
    };

    // Absolute, lexically normal path; symlinks resolved where the path exists
    std::filesystem::path normalize_path(const std::filesystem::path& path);

    // fnmatch(3) on the file name only
    bool matches_patterns(const std::filesystem::path& path, const std::vector<std::string>& patterns);

    /*
     * Immutable view of every unit and its documents at one point in time. Unit order is the
     * enumeration order of the source and is what graph queries use to break ties.
     */
    class workspace_snapshot {
      public:
        workspace_snapshot(std::string name, std::filesystem::path source, std::vector<unit_descriptor> units);

        const std::string& name() const { return name_; }
        const std::filesystem::path& source() const { return source_; }
        std::filesystem::path root() const;

        const std::vector<unit_descriptor>& units() const { return units_; }
        const unit_descriptor* find(std::string_view id) const;

        // owning unit ids in enumeration order, empty when no unit lists the file
        std::vector<std::string> units_containing(const std::filesystem::path& file) const;

        std::size_t document_count() const;

      private:
        std::string name_;
        std::filesystem::path source_;
        std::vector<unit_descriptor> units_;
        std::unordered_map<std::string, std::size_t> by_id_;
        std::unordered_map<std::string, std::vector<std::size_t>> by_document_;
    };

    using snapshot_ptr = std::shared_ptr<const workspace_snapshot>;

    class workspace_loader {
      public:
        virtual ~workspace_loader() = default;

        // throws error(workspace_load)
        virtual snapshot_ptr load(const std::filesystem::path& path) const = 0;
    };

    /*
     * Reads a `ripple.json` manifest:
     *
     *      {"name": "demo",
     *       "units": [{"id": "core", "language": "c++", "directory": "core",
     *                  "documents": ["gen/version.cpp"], "references": ["util"]}]}
     *
     * A directory path resolves to `<dir>/ripple.json`. Relative paths are anchored at the
     * manifest's directory, `directory` entries are scanned recursively with `patterns`.
     */
    class manifest_loader final : public workspace_loader {
      public:
        explicit manifest_loader(std::vector<std::string> patterns);

        snapshot_ptr load(const std::filesystem::path& path) const override;

        static std::filesystem::path resolve_manifest(const std::filesystem::path& path);

      private:
        std::vector<std::string> patterns_;
    };

    inline constexpr std::string_view manifest_file_name{"ripple.json"};

}  // namespace ripple::workspace
