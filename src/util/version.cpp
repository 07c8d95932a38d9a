#include <pinfold/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace pinfold {

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

static bool is_separator(char c) {
    return c == '.' || c == '-' || c == '_';
}

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return PinfoldError{PinfoldError::Version, "empty version string"};
    }
    if (is_separator(s.front()) || is_separator(s.back())) {
        return PinfoldError{PinfoldError::Version,
            "invalid version '" + s + "'",
            "versions start and end with a digit or letter"};
    }

    Version v;
    v.text_ = s;

    size_t i = 0;
    while (i < s.size()) {
        char c = s[i];
        if (is_separator(c)) {
            if (i + 1 < s.size() && is_separator(s[i + 1])) {
                return PinfoldError{PinfoldError::Version,
                    "invalid version '" + s + "': repeated separator"};
            }
            ++i;
            continue;
        }

        Component comp;
        size_t start = i;
        if (std::isdigit(static_cast<unsigned char>(c))) {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            comp.numeric = true;
            std::string digits = s.substr(start, i - start);
            if (digits.size() > 18) {
                return PinfoldError{PinfoldError::Version,
                    "version component too large in '" + s + "'"};
            }
            comp.number = std::stoll(digits);
            comp.text = digits;
        } else if (std::isalpha(static_cast<unsigned char>(c))) {
            while (i < s.size() && std::isalpha(static_cast<unsigned char>(s[i]))) ++i;
            comp.numeric = false;
            comp.text = s.substr(start, i - start);
        } else {
            return PinfoldError{PinfoldError::Version,
                "invalid character '" + std::string(1, c) +
                "' in version '" + s + "'"};
        }
        v.parts_.push_back(std::move(comp));
    }

    return Result<Version>::ok(std::move(v));
}

bool Version::Component::operator==(const Component& o) const {
    if (numeric != o.numeric) return false;
    return numeric ? number == o.number : text == o.text;
}

bool Version::Component::operator<(const Component& o) const {
    // Letters sort before numbers: 1.0rc1 < 1.0.1
    if (numeric != o.numeric) return !numeric;
    return numeric ? number < o.number : text < o.text;
}

bool Version::is_prefix_of(const Version& other) const {
    if (parts_.size() > other.parts_.size()) return false;
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (!(parts_[i] == other.parts_[i])) return false;
    }
    return true;
}

bool Version::operator==(const Version& o) const {
    return parts_ == o.parts_;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    size_t n = std::min(parts_.size(), o.parts_.size());
    for (size_t i = 0; i < n; ++i) {
        if (parts_[i] == o.parts_[i]) continue;
        return parts_[i] < o.parts_[i];
    }
    return parts_.size() < o.parts_.size();
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// VersionRange
// ---------------------------------------------------------------------------

// v lies at or below the upper bound `hi` (prefix-inclusive)
static bool below_upper(const Version& v, const Version& hi) {
    return v <= hi || hi.is_prefix_of(v);
}

// The more restrictive of two upper bounds
static const Version& tighter_upper(const Version& a, const Version& b) {
    if (a.is_prefix_of(b)) return b;
    if (b.is_prefix_of(a)) return a;
    return a < b ? a : b;
}

bool VersionRange::contains(const Version& v) const {
    if (lo && v < *lo) return false;
    if (hi && !below_upper(v, *hi)) return false;
    return true;
}

bool VersionRange::overlaps(const VersionRange& o) const {
    return intersection(o).has_value();
}

bool VersionRange::within(const VersionRange& o) const {
    if (o.lo) {
        if (!lo || *lo < *o.lo) return false;
    }
    if (o.hi) {
        if (!hi || !below_upper(*hi, *o.hi)) return false;
    }
    return true;
}

std::optional<VersionRange> VersionRange::intersection(const VersionRange& o) const {
    VersionRange r;
    if (lo && o.lo) r.lo = std::max(*lo, *o.lo);
    else if (lo) r.lo = lo;
    else r.lo = o.lo;

    if (hi && o.hi) r.hi = tighter_upper(*hi, *o.hi);
    else if (hi) r.hi = hi;
    else r.hi = o.hi;

    if (r.lo && r.hi && !below_upper(*r.lo, *r.hi)) {
        return std::nullopt;
    }
    return r;
}

std::string VersionRange::to_string() const {
    if (is_single()) return lo->to_string();
    std::string s;
    if (lo) s += lo->to_string();
    s += ":";
    if (hi) s += hi->to_string();
    return s;
}

bool VersionRange::operator==(const VersionRange& o) const {
    return lo == o.lo && hi == o.hi;
}

// ---------------------------------------------------------------------------
// VersionList
// ---------------------------------------------------------------------------

VersionList::VersionList(const Version& v) {
    ranges_.push_back(VersionRange::exactly(v));
}

static Result<VersionRange> parse_range(const std::string& text) {
    std::string s = text;
    while (!s.empty() && s.front() == ' ') s.erase(s.begin());
    while (!s.empty() && s.back() == ' ') s.pop_back();
    if (s.empty()) {
        return PinfoldError{PinfoldError::Version,
            "empty element in version list"};
    }

    size_t colon = s.find(':');
    if (colon == std::string::npos) {
        auto v = Version::parse(s);
        if (v.is_err()) return std::move(v).error();
        return Result<VersionRange>::ok(VersionRange::exactly(v.value()));
    }
    if (s.find(':', colon + 1) != std::string::npos) {
        return PinfoldError{PinfoldError::Version,
            "invalid version range '" + s + "'"};
    }

    VersionRange r;
    std::string lo = s.substr(0, colon);
    std::string hi = s.substr(colon + 1);
    if (!lo.empty()) {
        auto v = Version::parse(lo);
        if (v.is_err()) return std::move(v).error();
        r.lo = std::move(v).value();
    }
    if (!hi.empty()) {
        auto v = Version::parse(hi);
        if (v.is_err()) return std::move(v).error();
        r.hi = std::move(v).value();
    }
    if (r.lo && r.hi && !below_upper(*r.lo, *r.hi)) {
        return PinfoldError{PinfoldError::Version,
            "invalid version range '" + s + "': lower bound exceeds upper bound"};
    }
    return Result<VersionRange>::ok(std::move(r));
}

Result<VersionList> VersionList::parse(const std::string& s) {
    if (s.empty()) {
        return PinfoldError{PinfoldError::Version, "empty version list"};
    }

    VersionList list;
    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, ',')) {
        auto r = parse_range(token);
        if (r.is_err()) return std::move(r).error();
        // ":" alone is "any version"
        if (!r.value().lo && !r.value().hi) return Result<VersionList>::ok(VersionList{});
        list.ranges_.push_back(std::move(r).value());
    }
    if (!s.empty() && s.back() == ',') {
        return PinfoldError{PinfoldError::Version,
            "trailing ',' in version list '" + s + "'"};
    }
    return Result<VersionList>::ok(std::move(list));
}

bool VersionList::contains(const Version& v) const {
    if (is_any()) return true;
    return std::any_of(ranges_.begin(), ranges_.end(),
        [&](const VersionRange& r) { return r.contains(v); });
}

bool VersionList::intersects(const VersionList& o) const {
    if (is_any() || o.is_any()) return true;
    for (const auto& a : ranges_) {
        for (const auto& b : o.ranges_) {
            if (a.overlaps(b)) return true;
        }
    }
    return false;
}

bool VersionList::satisfies(const VersionList& o) const {
    if (o.is_any()) return true;
    if (is_any()) return false;
    return std::all_of(ranges_.begin(), ranges_.end(), [&](const VersionRange& r) {
        return std::any_of(o.ranges_.begin(), o.ranges_.end(),
            [&](const VersionRange& orng) { return r.within(orng); });
    });
}

std::optional<VersionList> VersionList::intersection(const VersionList& o) const {
    if (is_any()) return o;
    if (o.is_any()) return *this;

    VersionList out;
    for (const auto& a : ranges_) {
        for (const auto& b : o.ranges_) {
            auto r = a.intersection(b);
            if (r && std::find(out.ranges_.begin(), out.ranges_.end(), *r) ==
                         out.ranges_.end()) {
                out.ranges_.push_back(std::move(*r));
            }
        }
    }
    if (out.ranges_.empty()) return std::nullopt;
    return out;
}

std::string VersionList::to_string() const {
    if (is_any()) return ":";
    std::string s;
    for (size_t i = 0; i < ranges_.size(); ++i) {
        if (i > 0) s += ",";
        s += ranges_[i].to_string();
    }
    return s;
}

} // namespace pinfold
