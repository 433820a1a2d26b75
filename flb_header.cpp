#include "flb_header.hpp"
#include "utils.hpp"
#include <algorithm>

FlbHeader FlbHeader::parse(const char* data, size_t size) {
    auto rec = read_record<FlbHeaderRecord>(data, size, 0);

    FlbHeader hdr;
    hdr.magic.assign(rec.magic, rec.magic + sizeof(rec.magic));
    hdr.header_length = from_le(rec.header_length);
    hdr.unknown1 = rec.unknown1;
    hdr.data_length = from_le(rec.data_length);
    hdr.delimiter = from_le(rec.delimiter);
    hdr.description = decode_padded(rec.description, FLB_DESCRIPTION_SIZE);
    hdr.version1 = rec.version[0];
    hdr.version2 = rec.version[1];
    hdr.version3 = rec.version[2];
    return hdr;
}

bool FlbHeader::has_expected_magic() const {
    return magic.size() == sizeof(FLB_MAGIC) && std::equal(magic.begin(), magic.end(), FLB_MAGIC);
}

void FlbHeader::write(std::vector<char>& out) const {
    if (magic.size() != sizeof(FlbHeaderRecord::magic)) {
        throw FieldTooLongError("FLB magic must be 4 bytes, got " + std::to_string(magic.size()));
    }

    FlbHeaderRecord rec{};
    std::copy(magic.begin(), magic.end(), rec.magic);
    rec.header_length = to_le(header_length);
    rec.unknown1 = unknown1;
    rec.data_length = to_le(data_length);
    rec.delimiter = to_le(delimiter);
    auto desc_vec = encode_padded(description, FLB_DESCRIPTION_SIZE);
    std::memcpy(rec.description, desc_vec.data(), FLB_DESCRIPTION_SIZE);
    rec.version[0] = version1;
    rec.version[1] = version2;
    rec.version[2] = version3;

    append_record(out, rec);
}

void FlbHeader::print_info(Reporter& reporter) const {
    reporter.info("Version: " + std::to_string(version1) + "." + std::to_string(version2) + "." +
                  std::to_string(version3) + " Description: " + description);
    reporter.info("Header Length: " + std::to_string(header_length) +
                  " Data Length: " + std::to_string(data_length));
}
