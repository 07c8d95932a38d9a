#pragma once

#include <pinfold/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pinfold {

// Dotted package version: "1.2", "0.8.13", "2.0rc1", "1.0-beta".
// Components are split on '.', '-', '_' and at digit/letter boundaries.
class Version {
public:
    Version() = default;

    static Result<Version> parse(const std::string& s);

    const std::string& to_string() const { return text_; }
    size_t size() const { return parts_.size(); }

    // True if every component of this version leads `other`
    // ("2.2" is a prefix of "2.2" and of "2.2.1", not of "2.21").
    bool is_prefix_of(const Version& other) const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;

private:
    struct Component {
        bool numeric = true;
        long long number = 0;
        std::string text;

        bool operator==(const Component& o) const;
        bool operator<(const Component& o) const;
    };

    std::string text_;
    std::vector<Component> parts_;
};

// Inclusive range [lo, hi]. A missing bound is open. The upper bound also
// admits every version it is a prefix of, so ":2.2" contains "2.2.7".
// A single version "2.2" is the range [2.2, 2.2].
struct VersionRange {
    std::optional<Version> lo;
    std::optional<Version> hi;

    static VersionRange exactly(const Version& v) { return {v, v}; }

    bool contains(const Version& v) const;
    bool overlaps(const VersionRange& o) const;
    bool within(const VersionRange& o) const;
    std::optional<VersionRange> intersection(const VersionRange& o) const;
    bool is_single() const { return lo && hi && *lo == *hi; }

    std::string to_string() const;
    bool operator==(const VersionRange& o) const;
};

// Union of ranges: "1.0,1.2:1.4,2:". An empty list admits any version.
class VersionList {
public:
    VersionList() = default;
    explicit VersionList(const Version& v);

    static Result<VersionList> parse(const std::string& s);

    bool is_any() const { return ranges_.empty(); }

    // A single exact version, which is what a concrete spec carries
    bool is_single() const { return ranges_.size() == 1 && ranges_[0].is_single(); }
    // Only meaningful when is_single()
    const Version& single() const { return *ranges_[0].lo; }

    bool contains(const Version& v) const;
    bool intersects(const VersionList& o) const;
    // Every version admitted by this list is admitted by `o`
    bool satisfies(const VersionList& o) const;
    // nullopt when no version is admitted by both lists
    std::optional<VersionList> intersection(const VersionList& o) const;

    const std::vector<VersionRange>& ranges() const { return ranges_; }
    std::string to_string() const;

    bool operator==(const VersionList& o) const { return ranges_ == o.ranges_; }
    bool operator!=(const VersionList& o) const { return !(*this == o); }

private:
    std::vector<VersionRange> ranges_;
};

} // namespace pinfold
