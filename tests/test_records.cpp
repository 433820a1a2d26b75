#include "errors.hpp"
#include "flb_header.hpp"
#include "pci_details.hpp"
#include "pci_device_list.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <vector>

using flb_test::RawChunk;
using flb_test::RecordingReporter;

TEST(FlbHeader, ParsesEveryField) {
    RawChunk raw;
    raw.consistent();
    raw.unknown1 = 0x5a;
    auto bytes = raw.bytes();

    FlbHeader hdr = FlbHeader::parse(bytes.data(), bytes.size());
    EXPECT_TRUE(hdr.has_expected_magic());
    EXPECT_EQ(hdr.header_length, 151u);
    EXPECT_EQ(hdr.unknown1, 0x5a);
    EXPECT_EQ(hdr.data_length, 4u);
    EXPECT_EQ(hdr.delimiter, 0x8086);
    EXPECT_EQ(hdr.description, "Intel(R) Boot Agent XE");
    EXPECT_EQ(hdr.version1, 2);
    EXPECT_EQ(hdr.version2, 4);
    EXPECT_EQ(hdr.version3, 45);
}

TEST(FlbHeader, WriteReproducesWireBytes) {
    RawChunk raw;
    raw.consistent();
    auto bytes = raw.bytes();

    FlbHeader hdr = FlbHeader::parse(bytes.data(), bytes.size());
    std::vector<char> out;
    hdr.write(out);
    ASSERT_EQ(out.size(), FLB_HEADER_SIZE);
    EXPECT_EQ(out, std::vector<char>(bytes.begin(), bytes.begin() + FLB_HEADER_SIZE));
}

TEST(FlbHeader, UnexpectedMagicIsNotAnError) {
    RawChunk raw;
    raw.magic = "FLB2";
    raw.consistent();
    auto bytes = raw.bytes();

    FlbHeader hdr = FlbHeader::parse(bytes.data(), bytes.size());
    EXPECT_FALSE(hdr.has_expected_magic());
    std::vector<char> out;
    hdr.write(out);
    EXPECT_EQ(std::string(out.begin(), out.begin() + 4), "FLB2");
}

TEST(FlbHeader, ShortBufferIsTruncated) {
    RawChunk raw;
    auto bytes = raw.bytes();
    EXPECT_THROW(FlbHeader::parse(bytes.data(), FLB_HEADER_SIZE - 1), TruncatedInputError);
}

TEST(FlbHeader, WriteRejectsLongDescription) {
    FlbHeader hdr;
    hdr.magic = {'F', 'L', 'B', '3'};
    hdr.description = std::string(81, 'd');
    std::vector<char> out;
    EXPECT_THROW(hdr.write(out), FieldTooLongError);
}

TEST(FlbHeader, PrintInfoReportsVersionAndLengths) {
    RawChunk raw;
    raw.consistent();
    auto bytes = raw.bytes();
    RecordingReporter reporter;

    FlbHeader::parse(bytes.data(), bytes.size()).print_info(reporter);
    EXPECT_TRUE(reporter.has_info("Version: 2.4.45 Description: Intel(R) Boot Agent XE"));
    EXPECT_TRUE(reporter.has_info("Header Length: 151 Data Length: 4"));
}

TEST(PciDetails, ParsesTypeAndKeepsOpaqueBytes) {
    std::vector<char> bytes = {'\x00', '\x08', '\x00', '\x00'};
    for (int i = 0; i < 37; ++i) {
        bytes.push_back(static_cast<char>(i));
    }

    PciDetails details = PciDetails::parse(bytes.data(), bytes.size());
    EXPECT_EQ(details.flb_type, 0x800u);
    ASSERT_EQ(details.unknown.size(), 37u);
    EXPECT_EQ(details.unknown[36], 36);

    std::vector<char> out;
    details.write(out);
    EXPECT_EQ(out, bytes);
}

TEST(PciDetails, ClassifiesKnownCodes) {
    EXPECT_EQ(PciDetails::classify(0x300), FlbKind::Pxe);
    EXPECT_EQ(PciDetails::classify(0x800), FlbKind::UefiDriver);
    EXPECT_EQ(PciDetails::classify(0x100001), FlbKind::ComboImageVersionName);
    EXPECT_EQ(PciDetails::classify(0x20000100), FlbKind::Signature2);
    EXPECT_STREQ(flb_kind_name(FlbKind::Interface40G), "FLB_40G_INTERFACE");
}

TEST(PciDetails, UnknownCodeIsNotDecomposedAsBitmask) {
    // 0x300 | 0x800 shares bits with two known kinds but is not one of them
    EXPECT_FALSE(PciDetails::classify(0xb00).has_value());
    EXPECT_FALSE(PciDetails::classify(0xDEADBEEF).has_value());
}

TEST(PciDetails, PrintInfoNamesUnknownType) {
    PciDetails details;
    details.flb_type = 0xDEADBEEF;
    details.unknown.assign(37, 0);
    RecordingReporter reporter;
    details.print_info(reporter);
    EXPECT_TRUE(reporter.has_info("FLB type: 0xdeadbeef (UNKNOWN)"));
}

TEST(PciDetails, WriteRejectsWrongOpaqueSize) {
    PciDetails details;
    details.unknown.assign(36, 0);
    std::vector<char> out;
    EXPECT_THROW(details.write(out), FieldTooLongError);
}

TEST(PciDevice, ValidIffAnyFieldNonZero) {
    PciDevice dev;
    EXPECT_FALSE(dev.is_valid());
    dev.unk2 = 0x4100;
    EXPECT_TRUE(dev.is_valid());
}

TEST(PciDevice, FormatsLikeLspci) {
    PciDevice dev{0x8086, 0x1563, 0x15d9, 0x0903, 0, 0};
    EXPECT_EQ(dev.to_string(), "8086:1563 subsys 15d9:0903 unk 0000:0000");
}

TEST(PciDeviceList, EntryCountIsByteLengthOverTwelve) {
    RawChunk raw;
    raw.devices = {{0x8086, 0x1563, 0x15d9, 0x0903, 0, 0}, {0x8086, 0x15ad, 0, 0, 0, 0x4100}, {0, 0, 0, 0, 0, 0}};
    auto bytes = raw.bytes();
    const char* list_start = bytes.data() + FLB_FIXED_HEADERS_SIZE;

    PciDeviceList list = PciDeviceList::parse(list_start, 36, 36);
    ASSERT_EQ(list.devices.size(), 3u);
    EXPECT_EQ(list.devices[0].device, 0x1563);
    EXPECT_EQ(list.devices[1].unk2, 0x4100);
    EXPECT_FALSE(list.devices[2].is_valid());
    EXPECT_EQ(list.byte_size(), 36u);
}

TEST(PciDeviceList, KeepsEntriesAfterAZeroEntry) {
    RawChunk raw;
    raw.devices = {{0, 0, 0, 0, 0, 0}, {0x8086, 0x10fb, 0, 0, 0, 0}, {0, 0, 0, 0, 0, 0}};
    auto bytes = raw.bytes();

    PciDeviceList list = PciDeviceList::parse(bytes.data() + FLB_FIXED_HEADERS_SIZE, 36, 36);
    ASSERT_EQ(list.devices.size(), 3u);
    EXPECT_EQ(list.devices[1].device, 0x10fb);
}

TEST(PciDeviceList, MisalignedLengthFails) {
    std::vector<char> bytes(24, '\0');
    EXPECT_THROW(PciDeviceList::parse(bytes.data(), bytes.size(), 13), MisalignedDeviceListError);
}

TEST(PciDeviceList, LengthBeyondBufferIsTruncated) {
    std::vector<char> bytes(12, '\0');
    EXPECT_THROW(PciDeviceList::parse(bytes.data(), bytes.size(), 24), TruncatedInputError);
}

TEST(PciDeviceList, WriteDoesNotAddSentinel) {
    PciDeviceList list;
    list.devices.push_back({0x8086, 0x1533, 0, 0, 0, 0});
    std::vector<char> out;
    list.write(out);
    ASSERT_EQ(out.size(), 12u);
    EXPECT_EQ(static_cast<unsigned char>(out[0]), 0x86);
    EXPECT_EQ(static_cast<unsigned char>(out[1]), 0x80);
    EXPECT_EQ(static_cast<unsigned char>(out[2]), 0x33);
    EXPECT_EQ(static_cast<unsigned char>(out[3]), 0x15);
}

TEST(PciDeviceList, PrintInfoSkipsSentinel) {
    PciDeviceList list;
    list.devices = {{0x8086, 0x1563, 0x15d9, 0x0903, 0, 0}, {}};
    RecordingReporter reporter;
    list.print_info(reporter);
    ASSERT_EQ(reporter.infos.size(), 2u);
    EXPECT_EQ(reporter.infos[0], "Supported PCI Devices:");
    EXPECT_EQ(reporter.infos[1], "  8086:1563 subsys 15d9:0903 unk 0000:0000");
}
