#ifndef PUSHLINE_REMOTE_MODEL_H_
#define PUSHLINE_REMOTE_MODEL_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Pushline {

/// Kinds of unit stored by the remote service
enum class UnitType {
    kRpm,
    kFile,
    kErratum,
    kModulemd,
    kComps,
    kProductId,
};

std::string_view UnitTypeName(UnitType type);
std::optional<UnitType> ParseUnitType(std::string_view name);

/// Advisory content carried by erratum units
struct ErratumFields {
    std::string title;
    std::string severity;
    std::string status;
    std::string advisory_type;
    std::string issued;
    std::string updated;
    std::string release;
    std::string solution;
    std::string summary;
    bool reboot_suggested = false;
    std::vector<std::string> references;
    std::vector<std::string> pkglist;

    bool operator==(const ErratumFields&) const = default;
};

/**
 * The remote service's stored representation of one artifact.
 *
 * One struct covers every unit type; fields a type does not use stay empty.
 * `name` is the rpm filename, the file path, the erratum id, or the
 * module / comps / productid name.
 */
struct Unit {
    UnitType type = UnitType::kFile;
    std::string unit_id;
    std::string name;
    std::string sha256sum;
    std::string md5sum;
    uint64_t size = 0;
    std::string signing_key;
    std::string cdn_path;
    std::optional<std::string> cdn_published;

    // Mutable metadata (file units), or the version counter (errata)
    std::string description;
    std::string version;
    std::optional<double> display_order;

    ErratumFields erratum;

    // Sorted, no duplicates
    std::vector<std::string> repository_memberships;

    bool operator==(const Unit&) const = default;

    /// Value of a searchable field, or nullopt if the field is unknown.
    std::optional<std::string> Field(std::string_view field) const;

    bool InRepository(std::string_view repo_id) const;
    void AddMembership(const std::string& repo_id);
    void RemoveMembership(std::string_view repo_id);

    std::string DebugString() const;
};

/// A named, publishable collection of units
struct Repository {
    std::string id;
    std::string content_type = "yum";
    std::string relative_url;
    uint64_t publish_count = 0;

    bool operator==(const Repository&) const = default;

    std::optional<std::string> Field(std::string_view field) const;
};

/// Completed asynchronous operation on the remote service
struct Task {
    std::string task_id;
    std::string repo_id;
    std::vector<Unit> units;
};

struct UploadRequest {
    // Local path of the content; empty for metadata-only units (errata)
    std::string src;
    // Desired unit, type and identity fields set; unit_id is assigned remotely
    Unit unit;
};

struct CopyOptions {
    bool require_signed_rpms = false;
};

struct PublishOptions {
    bool force = false;
    bool clean = false;
};

} // namespace Pushline

#endif // PUSHLINE_REMOTE_MODEL_H_
