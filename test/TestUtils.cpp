#include "test/TestUtils.hpp"

#include <inttypes.h>
#include <stdio.h>

#include <algorithm>
#include <boost/filesystem.hpp>
#include <fstream>
#include <set>

#include "base/Checksum.hpp"
#include "base/Endian.hpp"
#include "chunk/BitStream.hpp"
#include "chunk/ChunkInterface.hpp"
#include "chunk/ChunkUtils.hpp"
#include "index/IndexUtils.hpp"

namespace tsdump {
namespace test {

base::Status MemorySource::range(uint64_t begin, uint64_t end,
                                 std::string *result) const {
  if (!fail_.ok()) return fail_;
  base::Status s = tsdbutil::check_range(*this, begin, end);
  if (!s.ok()) return s;
  ranges.emplace_back(begin, end);
  result->assign(data_, begin, end - begin);
  return base::Status::OK();
}

base::Status FakeObjectStore::HeadObject(const std::string &bucket,
                                         const std::string &key,
                                         uint64_t *size) {
  ++num_heads;
  keys.push_back(key);
  if (!head_error_.ok()) return head_error_;
  auto it = objects_.find(path(bucket, key));
  if (it == objects_.end())
    return base::Status::NotFound("no such key", path(bucket, key));
  *size = it->second.size();
  return base::Status::OK();
}

base::Status FakeObjectStore::GetObject(const std::string &bucket,
                                        const std::string &key,
                                        const std::string &range,
                                        std::string *body) {
  range_headers.push_back(range);
  if (!get_error_.ok()) return get_error_;
  auto it = objects_.find(path(bucket, key));
  if (it == objects_.end())
    return base::Status::NotFound("no such key", path(bucket, key));
  if (range.empty()) {
    *body = it->second;
    return base::Status::OK();
  }
  uint64_t first = 0, last = 0;
  if (sscanf(range.c_str(), "bytes=%" SCNu64 "-%" SCNu64, &first, &last) != 2 ||
      first > last || last >= it->second.size()) {
    return base::Status::IOError("invalid range", range);
  }
  *body = it->second.substr(first, last - first + 1);
  body->resize(body->size() - std::min(drop_bytes_, body->size()));
  return base::Status::OK();
}

namespace {

bool bit_range(int64_t x, int nbits) {
  return -((int64_t(1) << (nbits - 1)) - 1) <= x &&
         x <= (int64_t(1) << (nbits - 1));
}

int leading_zeros(uint64_t x) {
  int n = 0;
  while (n < 64 && !(x & (uint64_t(1) << (63 - n)))) ++n;
  return n;
}

int trailing_zeros(uint64_t x) {
  int n = 0;
  while (n < 64 && !(x & (uint64_t(1) << n))) ++n;
  return n;
}

void write_varint_bytes(chunk::BitStream *bs, const uint8_t *buf, int n) {
  for (int i = 0; i < n; ++i) bs->write_byte(buf[i]);
}

}  // namespace

std::string xor_chunk(const Samples &samples) {
  chunk::BitStream bs;
  int64_t t_prev = 0;
  uint64_t t_delta = 0;
  uint64_t v_prev = 0;
  int leading = 0xff, trailing = 0;
  uint8_t buf[10];

  for (size_t i = 0; i < samples.size(); ++i) {
    int64_t t = samples[i].first;
    uint64_t v = base::encode_double(samples[i].second);
    if (i == 0) {
      write_varint_bytes(&bs, buf, base::encode_signed_varint(buf, t));
      bs.write_bits(v, 64);
    } else {
      uint64_t delta = static_cast<uint64_t>(t - t_prev);
      if (i == 1) {
        write_varint_bytes(&bs, buf, base::encode_unsigned_varint(buf, delta));
      } else {
        int64_t dod = static_cast<int64_t>(delta - t_delta);
        if (dod == 0) {
          bs.write_bit(chunk::ZERO);
        } else if (bit_range(dod, 14)) {
          bs.write_bits(0x02, 2);
          bs.write_bits(static_cast<uint64_t>(dod), 14);
        } else if (bit_range(dod, 17)) {
          bs.write_bits(0x06, 3);
          bs.write_bits(static_cast<uint64_t>(dod), 17);
        } else if (bit_range(dod, 20)) {
          bs.write_bits(0x0e, 4);
          bs.write_bits(static_cast<uint64_t>(dod), 20);
        } else {
          bs.write_bits(0x0f, 4);
          bs.write_bits(static_cast<uint64_t>(dod), 64);
        }
      }
      t_delta = delta;

      uint64_t v_delta = v ^ v_prev;
      if (v_delta == 0) {
        bs.write_bit(chunk::ZERO);
      } else {
        bs.write_bit(chunk::ONE);
        int lz = std::min(leading_zeros(v_delta), 31);
        int tz = trailing_zeros(v_delta);
        if (leading != 0xff && lz >= leading && tz >= trailing) {
          bs.write_bit(chunk::ZERO);
          bs.write_bits(v_delta >> trailing, 64 - leading - trailing);
        } else {
          leading = lz;
          trailing = tz;
          bs.write_bit(chunk::ONE);
          bs.write_bits(static_cast<uint64_t>(lz), 5);
          int sigbits = 64 - lz - tz;
          bs.write_bits(static_cast<uint64_t>(sigbits), 6);
          bs.write_bits(v_delta >> tz, sigbits);
        }
      }
    }
    t_prev = t;
    v_prev = v;
  }

  std::string r(2, '\0');
  base::put_uint16_big_endian(reinterpret_cast<uint8_t *>(&r[0]),
                              static_cast<int>(samples.size()));
  const std::vector<uint8_t> *bytes = bs.bytes();
  r.append(bytes->begin(), bytes->end());
  return r;
}

std::string chunk_record(uint8_t encoding, const std::string &payload) {
  std::string r;
  base::append_unsigned_varint(&r, payload.size());
  std::string body(1, static_cast<char>(encoding));
  body += payload;
  r += body;
  base::append_uint32_big_endian(&r, base::GetCrc32c(body));
  return r;
}

std::string segment_header() {
  std::string r;
  base::append_uint32_big_endian(&r, chunk::MAGIC_CHUNK);
  r.push_back(static_cast<char>(chunk::CHUNK_FORMAT_V1));
  r.append(3, '\0');
  return r;
}

TestChunk xor_test_chunk(const Samples &samples) {
  return TestChunk(chunk::EncXOR, xor_chunk(samples),
                   samples.empty() ? 0 : samples.front().first,
                   samples.empty() ? 0 : samples.back().first);
}

void BlockBuilder::add_series(const label::Labels &lset,
                              const std::vector<Samples> &chunks) {
  std::vector<TestChunk> c;
  for (const Samples &s : chunks) c.push_back(xor_test_chunk(s));
  add_series_chunks(lset, c);
}

void BlockBuilder::add_series_chunks(const label::Labels &lset,
                                     const std::vector<TestChunk> &chunks) {
  series_.emplace_back(label::lbs_sorted_by_name(lset), chunks);
}

namespace {

// len <4b> | content | CRC32 <4b>
void append_section(std::string *dst, const std::string &content) {
  base::append_uint32_big_endian(dst, content.size());
  dst->append(content);
  base::append_uint32_big_endian(dst, base::GetCrc32c(content));
}

void append_uvarint_string(std::string *dst, const std::string &s) {
  base::append_unsigned_varint(dst, s.size());
  dst->append(s);
}

}  // namespace

void BlockBuilder::build() {
  refs_.clear();

  // Segment.
  segment_ = segment_header();
  std::vector<std::vector<uint64_t>> chunk_refs;
  for (const auto &s : series_) {
    chunk_refs.emplace_back();
    for (const TestChunk &c : s.second) {
      chunk_refs.back().push_back(segment_.size());
      segment_ += chunk_record(c.encoding, c.payload);
    }
  }

  // Symbols.
  std::set<std::string> symbol_set;
  for (const auto &s : series_) {
    for (const label::Label &l : s.first) {
      symbol_set.insert(l.label);
      symbol_set.insert(l.value);
    }
  }
  std::map<std::string, uint64_t> symbol_ref;
  std::string content;
  base::append_uint32_big_endian(&content, symbol_set.size());
  for (const std::string &sym : symbol_set) {
    uint64_t n = symbol_ref.size();
    symbol_ref[sym] = n;
    append_uvarint_string(&content, sym);
  }

  index_.clear();
  base::append_uint32_big_endian(&index_, index::MAGIC_INDEX);
  index_.push_back(static_cast<char>(index::INDEX_VERSION_V2));

  uint64_t toc[6];
  toc[0] = index_.size();
  append_section(&index_, content);

  // Series.
  std::map<std::pair<std::string, std::string>, std::vector<uint32_t>> postings;
  toc[1] = 0;
  for (size_t i = 0; i < series_.size(); ++i) {
    while (index_.size() % index::SERIES_ALIGNMENT != 0) index_.push_back('\0');
    if (i == 0) toc[1] = index_.size();
    uint64_t ref = index_.size() / index::SERIES_ALIGNMENT;
    refs_.push_back(ref);

    const label::Labels &lset = series_[i].first;
    const std::vector<TestChunk> &chunks = series_[i].second;
    content.clear();
    base::append_unsigned_varint(&content, lset.size());
    for (const label::Label &l : lset) {
      base::append_unsigned_varint(&content, symbol_ref[l.label]);
      base::append_unsigned_varint(&content, symbol_ref[l.value]);
      postings[std::make_pair(l.label, l.value)].push_back(ref);
    }
    postings[std::make_pair(label::ALL_POSTINGS_KEYS.label,
                            label::ALL_POSTINGS_KEYS.value)]
        .push_back(ref);

    base::append_unsigned_varint(&content, chunks.size());
    int64_t last_t = 0;
    uint64_t last_ref = 0;
    for (size_t j = 0; j < chunks.size(); ++j) {
      const TestChunk &c = chunks[j];
      uint64_t cref = chunk_refs[i][j];
      if (j == 0) {
        base::append_signed_varint(&content, c.min_time);
        base::append_unsigned_varint(&content, c.max_time - c.min_time);
        base::append_unsigned_varint(&content, cref);
      } else {
        base::append_unsigned_varint(&content, c.min_time - last_t);
        base::append_unsigned_varint(&content, c.max_time - c.min_time);
        base::append_signed_varint(&content, static_cast<int64_t>(cref) -
                                                 static_cast<int64_t>(last_ref));
      }
      last_t = c.max_time;
      last_ref = cref;
    }
    base::append_unsigned_varint(&index_, content.size());
    index_.append(content);
    base::append_uint32_big_endian(&index_, base::GetCrc32c(content));
  }

  // Label indices, left empty.
  toc[2] = 0;
  toc[3] = index_.size();
  content.clear();
  base::append_uint32_big_endian(&content, 0);
  append_section(&index_, content);

  // Postings.
  toc[4] = index_.size();
  std::map<std::pair<std::string, std::string>, uint64_t> offsets;
  for (const auto &p : postings) {
    offsets[p.first] = index_.size();
    content.clear();
    base::append_uint32_big_endian(&content, p.second.size());
    for (uint32_t ref : p.second) base::append_uint32_big_endian(&content, ref);
    append_section(&index_, content);
  }

  // Postings offset table.
  toc[5] = index_.size();
  content.clear();
  base::append_uint32_big_endian(&content, offsets.size());
  for (const auto &o : offsets) {
    base::append_unsigned_varint(&content, 2);
    append_uvarint_string(&content, o.first.first);
    append_uvarint_string(&content, o.first.second);
    base::append_unsigned_varint(&content, o.second);
  }
  append_section(&index_, content);

  // TOC.
  content.clear();
  for (uint64_t off : toc) base::append_uint64_big_endian(&content, off);
  index_.append(content);
  base::append_uint32_big_endian(&index_, base::GetCrc32c(content));
}

void BlockBuilder::write(const std::string &dir) {
  build();
  boost::filesystem::path root(dir);
  boost::filesystem::create_directories(root / chunk::CHUNKS_DIR_NAME);
  {
    std::ofstream f((root / "index").string(), std::ios::binary);
    f.write(index_.data(), index_.size());
  }
  {
    std::ofstream f(
        (root / chunk::CHUNKS_DIR_NAME / chunk::segment_file_name(0)).string(),
        std::ios::binary);
    f.write(segment_.data(), segment_.size());
  }
}

TempDir::TempDir() {
  boost::filesystem::path p = boost::filesystem::temp_directory_path() /
                              boost::filesystem::unique_path("tsdump-%%%%-%%%%");
  boost::filesystem::create_directories(p);
  path_ = p.string();
}

TempDir::~TempDir() {
  boost::system::error_code ec;
  boost::filesystem::remove_all(path_, ec);
}

}  // namespace test
}  // namespace tsdump
