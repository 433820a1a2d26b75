#include "pci_details.hpp"
#include "utils.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace {

const std::pair<uint32_t, FlbKind> FLB_KNOWN_KINDS[] = {
    {0x300, FlbKind::Pxe},
    {0x800, FlbKind::UefiDriver},
    {0x1000, FlbKind::IscsiOption},
    {0x2000, FlbKind::FcoeOption},
    {0x10000, FlbKind::ComboRules},
    {0x100000, FlbKind::CivdBin}, // payload seems to start with $CIV
    {0x100001, FlbKind::ComboImageVersionName},
    {0x200000, FlbKind::OcdOption},
    {0x800000, FlbKind::ClpLoader},
    {0x1000000, FlbKind::IscsiSetup},
    {0x2000000, FlbKind::Interface40G},
    {0x10000000, FlbKind::UefiX64FcoeDriver},
    {0x20000000, FlbKind::Signature},
    {0x20000100, FlbKind::Signature2},
};

} // namespace

const char* flb_kind_name(FlbKind kind) {
    switch (kind) {
    case FlbKind::Pxe: return "FLB_PXE";
    case FlbKind::UefiDriver: return "FLB_UEFI_DRIVER";
    case FlbKind::IscsiOption: return "FLB_ISCSI_OPTION";
    case FlbKind::FcoeOption: return "FLB_FCOE_OPTION";
    case FlbKind::ComboRules: return "FLB_COMBO_RULES";
    case FlbKind::CivdBin: return "FLB_CIVD_BIN";
    case FlbKind::ComboImageVersionName: return "FLB_COMBO_IMAGE_VERSION_NAME";
    case FlbKind::OcdOption: return "FLB_OCD_OPTION";
    case FlbKind::ClpLoader: return "FLB_CLP_LOADER";
    case FlbKind::IscsiSetup: return "FLB_ISCSI_SETUP";
    case FlbKind::Interface40G: return "FLB_40G_INTERFACE";
    case FlbKind::UefiX64FcoeDriver: return "FLB_UEFI_X64_FCOE_DRIVER";
    case FlbKind::Signature: return "FLB_SIGNATURE";
    case FlbKind::Signature2: return "FLB_SIGNATURE_2";
    }
    return "UNKNOWN";
}

PciDetails PciDetails::parse(const char* data, size_t size) {
    auto rec = read_record<FlbPciDetailsRecord>(data, size, 0);

    PciDetails details;
    details.flb_type = from_le(rec.flb_type);
    details.unknown.assign(rec.unknown, rec.unknown + FLB_PCI_DETAILS_UNKNOWN_SIZE);
    return details;
}

std::optional<FlbKind> PciDetails::classify(uint32_t flb_type) {
    for (const auto& entry : FLB_KNOWN_KINDS) {
        if (entry.first == flb_type) return entry.second;
    }
    return std::nullopt;
}

void PciDetails::write(std::vector<char>& out) const {
    if (unknown.size() != FLB_PCI_DETAILS_UNKNOWN_SIZE) {
        throw FieldTooLongError("PCI details opaque block must be " + std::to_string(FLB_PCI_DETAILS_UNKNOWN_SIZE) +
                                " bytes, got " + std::to_string(unknown.size()));
    }

    FlbPciDetailsRecord rec{};
    rec.flb_type = to_le(flb_type);
    std::copy(unknown.begin(), unknown.end(), rec.unknown);
    append_record(out, rec);
}

void PciDetails::print_info(Reporter& reporter) const {
    std::ostringstream oss;
    oss << "FLB type: 0x" << std::hex << flb_type << std::dec << " (";
    auto k = kind();
    oss << (k.has_value() ? flb_kind_name(*k) : "UNKNOWN") << ")";
    reporter.info(oss.str());
}
