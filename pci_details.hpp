#ifndef PCI_DETAILS_HPP
#define PCI_DETAILS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "shared_structure.hpp"
#include "reporter.hpp"

// Known values of the classification type code. The table is empirical; any other
// value is still valid data.
enum class FlbKind {
    Pxe,
    UefiDriver,
    IscsiOption,
    FcoeOption,
    ComboRules,
    CivdBin,
    ComboImageVersionName,
    OcdOption,
    ClpLoader,
    IscsiSetup,
    Interface40G,
    UefiX64FcoeDriver,
    Signature,
    Signature2,
};

const char* flb_kind_name(FlbKind kind);

// The 41-byte device-classification block following the chunk header.
class PciDetails {
public:
    uint32_t flb_type = 0;
    std::vector<uint8_t> unknown; // 37 opaque bytes, kept verbatim

    static PciDetails parse(const char* data, size_t size);

    // Looks up a type code in the table of known kinds. Treated as a plain value,
    // not a bitmask.
    static std::optional<FlbKind> classify(uint32_t flb_type);

    std::optional<FlbKind> kind() const { return classify(flb_type); }

    void write(std::vector<char>& out) const;

    void print_info(Reporter& reporter) const;
};

#endif // PCI_DETAILS_HPP
