#include "index/IndexReader.hpp"

#include <algorithm>

#include "base/Checksum.hpp"
#include "base/Endian.hpp"
#include "base/Logging.hpp"
#include "index/EmptyPostings.hpp"
#include "index/Uint32BEPostings.hpp"
#include "tsdbutil/DecBuf.hpp"

namespace tsdump {
namespace index {

IndexReader::IndexReader(std::unique_ptr<tsdbutil::RangedByteSource> &&b)
    : b(std::move(b)) {}

base::Status IndexReader::Open(std::unique_ptr<tsdbutil::RangedByteSource> &&b,
                               std::unique_ptr<IndexReader> *result) {
  result->reset();
  std::unique_ptr<IndexReader> r(new IndexReader(std::move(b)));
  base::Status s = r->init();
  if (!s.ok()) return s;
  *result = std::move(r);
  return base::Status::OK();
}

base::Status IndexReader::init() {
  base::Status s = validate();
  if (!s.ok()) return s;

  s = toc_from_source(*b, &toc_);
  if (!s.ok()) return s.Wrap("read TOC");
  LOG_DEBUG << "index " << b->name() << " TOC " << toc_string(toc_);

  s = read_symbols();
  if (!s.ok()) return s.Wrap("read symbols");

  s = read_postings_table();
  if (!s.ok()) return s.Wrap("read postings offset table");
  return base::Status::OK();
}

base::Status IndexReader::validate() {
  if (b->len() < static_cast<uint64_t>(HEADER_LEN)) {
    return base::Status::Corruption(b->name(), "index shorter than header");
  }
  std::string header;
  base::Status s = b->range(0, HEADER_LEN, &header);
  if (!s.ok()) return s;
  const uint8_t *p = reinterpret_cast<const uint8_t *>(header.data());
  if (base::get_uint32_big_endian(p) != MAGIC_INDEX) {
    return base::Status::Corruption(b->name(), "invalid index magic");
  }
  if (p[4] != INDEX_VERSION_V2) {
    return base::Status::NotSupported(
        b->name(), "index version " + std::to_string(p[4]));
  }
  return base::Status::OK();
}

base::Status IndexReader::read_section(uint64_t offset, std::string *content) {
  std::string len_field;
  base::Status s = b->range(offset, offset + 4, &len_field);
  if (!s.ok()) return s;
  uint64_t len = base::get_uint32_big_endian(
      reinterpret_cast<const uint8_t *>(len_field.data()));

  std::string buf;
  s = b->range(offset + 4, offset + 4 + len + 4, &buf);
  if (!s.ok()) return s;
  const uint8_t *p = reinterpret_cast<const uint8_t *>(buf.data());
  if (base::get_uint32_big_endian(p + len) != base::GetCrc32c(p, len)) {
    return base::Status::Corruption(
        b->name(), "checksum mismatch at offset " + std::to_string(offset));
  }
  buf.resize(len);
  content->swap(buf);
  return base::Status::OK();
}

base::Status IndexReader::read_symbols() {
  std::string content;
  base::Status s = read_section(toc_.symbols, &content);
  if (!s.ok()) return s;

  tsdbutil::DecBuf dec_buf(content);
  // #symbols <4b>
  uint32_t num_symbols = dec_buf.get_BE_uint32();
  symbols_.reserve(std::min<uint64_t>(num_symbols, content.size()));
  for (uint32_t i = 0; i < num_symbols && dec_buf.err == tsdbutil::NO_ERR;
       i++)
    symbols_.push_back(dec_buf.get_uvariant_string());
  if (dec_buf.err != tsdbutil::NO_ERR) {
    return base::Status::Corruption(b->name(), dec_buf.error_str());
  }
  return base::Status::OK();
}

base::Status IndexReader::read_postings_table() {
  std::string content;
  base::Status s = read_section(toc_.postings_table, &content);
  if (!s.ok()) return s;

  tsdbutil::DecBuf dec_buf(content);
  uint32_t num_entries = dec_buf.get_BE_uint32();
  // Read label name, label value to offset of postings
  for (uint32_t i = 0; i < num_entries && dec_buf.err == tsdbutil::NO_ERR;
       i++) {
    uint64_t temp_num = dec_buf.get_unsigned_variant();
    if (dec_buf.err == tsdbutil::NO_ERR && temp_num != 2) {
      return base::Status::Corruption(
          b->name(), "postings table entry with " + std::to_string(temp_num) +
                         " keys");
    }
    std::string label_name = dec_buf.get_uvariant_string();
    std::string label_value = dec_buf.get_uvariant_string();
    uint64_t offset = dec_buf.get_unsigned_variant();
    if (dec_buf.err == tsdbutil::NO_ERR)
      postings_table[label_name][label_value] = offset;
  }
  if (dec_buf.err != tsdbutil::NO_ERR) {
    return base::Status::Corruption(b->name(), dec_buf.error_str());
  }
  return base::Status::OK();
}

base::Status IndexReader::postings(const std::string &name,
                                   const std::string &value,
                                   std::unique_ptr<PostingsInterface> *p) {
  p->reset();
  if (!b) return base::Status::InvalidArgument("index reader closed");

  auto name_it = postings_table.find(name);
  if (name_it == postings_table.end()) {
    LOG_DEBUG << "postings: label name " << name << " not in index";
    p->reset(new EmptyPostings());
    return base::Status::OK();
  }
  auto value_it = name_it->second.find(value);
  if (value_it == name_it->second.end()) {
    LOG_DEBUG << "postings: label " << name << "=" << value
              << " not in index";
    p->reset(new EmptyPostings());
    return base::Status::OK();
  }

  std::string content;
  base::Status s = read_section(value_it->second, &content);
  if (!s.ok()) return s.Wrap("postings " + name + "=" + value);

  tsdbutil::DecBuf dec_buf(content);
  uint32_t num = dec_buf.get_BE_uint32();
  if (dec_buf.err != tsdbutil::NO_ERR ||
      dec_buf.len() != static_cast<uint64_t>(num) * 4) {
    return base::Status::Corruption(
        b->name(), "postings " + name + "=" + value + " has invalid size");
  }
  p->reset(new Uint32BEPostings(content.substr(4)));
  return base::Status::OK();
}

base::Status IndexReader::series(uint64_t ref, label::Labels *lset,
                                 std::deque<chunk::ChunkMeta> *chunks) {
  lset->clear();
  chunks->clear();
  if (!b) return base::Status::InvalidArgument("index reader closed");

  std::string context = "series " + std::to_string(ref);
  uint64_t offset = ref * SERIES_ALIGNMENT;
  if (offset >= b->len()) {
    return base::Status::Corruption(b->name(),
                                    context + " beyond end of index");
  }

  std::string window;
  base::Status s = b->range(
      offset,
      offset + std::min<uint64_t>(base::MAX_VARINT_LEN_32, b->len() - offset),
      &window);
  if (!s.ok()) return s.Wrap(context);
  int decoded = 0;
  uint64_t len = base::decode_unsigned_varint(
      reinterpret_cast<const uint8_t *>(window.data()), decoded,
      static_cast<int>(window.size()));
  if (decoded == 0) {
    return base::Status::Corruption(b->name(), context + " invalid length");
  }
  uint64_t begin = offset + decoded;
  if (len + 4 > b->len() - begin) {
    return base::Status::Corruption(b->name(), context + " truncated");
  }

  std::string buf;
  s = b->range(begin, begin + len + 4, &buf);
  if (!s.ok()) return s.Wrap(context);
  const uint8_t *p = reinterpret_cast<const uint8_t *>(buf.data());
  if (base::get_uint32_big_endian(p + len) != base::GetCrc32c(p, len)) {
    return base::Status::Corruption(b->name(), context + " checksum mismatch");
  }
  tsdbutil::DecBuf dec_buf(p, len);

  // Decode the Labels
  uint64_t num_labels = dec_buf.get_unsigned_variant();
  for (uint64_t i = 0; i < num_labels; i++) {
    uint64_t ref_name = dec_buf.get_unsigned_variant();
    uint64_t ref_value = dec_buf.get_unsigned_variant();

    if (dec_buf.err != tsdbutil::NO_ERR) {
      return base::Status::Corruption(b->name(),
                                      context + " fail to read labels");
    }
    if (ref_name >= symbols_.size() || ref_value >= symbols_.size()) {
      return base::Status::Corruption(
          b->name(), context + " invalid index of label name or value");
    }
    lset->emplace_back(symbols_[ref_name], symbols_[ref_value]);
  }

  // Decode the Chunks
  uint64_t num_chunks = dec_buf.get_unsigned_variant();
  if (dec_buf.err != tsdbutil::NO_ERR) {
    return base::Status::Corruption(b->name(),
                                    context + " fail to read #chunks");
  }
  if (num_chunks == 0) return base::Status::OK();

  // First chunk meta
  int64_t last_t = dec_buf.get_signed_variant();
  uint64_t delta_t = dec_buf.get_unsigned_variant();
  int64_t last_ref = static_cast<int64_t>(dec_buf.get_unsigned_variant());
  if (dec_buf.err != tsdbutil::NO_ERR) {
    return base::Status::Corruption(b->name(),
                                    context + " fail to read chunk meta 0");
  }
  chunks->emplace_back(static_cast<uint64_t>(last_ref), last_t,
                       static_cast<int64_t>(delta_t) + last_t);
  last_t += static_cast<int64_t>(delta_t);

  for (uint64_t i = 1; i < num_chunks; i++) {
    int64_t mint = last_t + static_cast<int64_t>(dec_buf.get_unsigned_variant());
    delta_t = dec_buf.get_unsigned_variant();
    last_ref += dec_buf.get_signed_variant();
    if (dec_buf.err != tsdbutil::NO_ERR) {
      return base::Status::Corruption(
          b->name(), context + " fail to read chunk meta " + std::to_string(i));
    }
    last_t = mint + static_cast<int64_t>(delta_t);
    chunks->emplace_back(static_cast<uint64_t>(last_ref), mint, last_t);
  }
  return base::Status::OK();
}

label::Label IndexReader::all_postings_key() const {
  return label::ALL_POSTINGS_KEYS;
}

void IndexReader::close() {
  if (b) {
    LOG_DEBUG << "close index " << b->name();
    b.reset();
  }
}

uint64_t IndexReader::size() const { return b ? b->len() : 0; }

}  // namespace index
}  // namespace tsdump
