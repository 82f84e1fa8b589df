#ifndef INDEXREADER_H
#define INDEXREADER_H

#include <map>
#include <memory>
#include <vector>

#include "block/IndexReaderInterface.hpp"
#include "index/IndexUtils.hpp"
#include "index/TOC.hpp"
#include "tsdbutil/RangedByteSource.hpp"

namespace tsdump {
namespace index {

// Reader of the Prometheus index format v2 over any RangedByteSource.
// Symbols and the postings offset table are loaded at open, postings lists
// and series entries are fetched on demand.
class IndexReader : public block::IndexReaderInterface {
 private:
  std::unique_ptr<tsdbutil::RangedByteSource> b;

  TOC toc_;

  // label name -> label value -> offset of postings list
  std::map<std::string, std::map<std::string, uint64_t>> postings_table;

  std::vector<std::string> symbols_;

  IndexReader(std::unique_ptr<tsdbutil::RangedByteSource> &&b);

  base::Status init();

  base::Status validate();

  // Content of a section laid out as len <4b> | content | CRC32 <4b>,
  // checksum verified.
  base::Status read_section(uint64_t offset, std::string *content);

  // ┌────────────────────┬─────────────────────┐
  // │ len <4b>           │ #symbols <4b>       │
  // ├────────────────────┴─────────────────────┤
  // │ ┌──────────────────────┬───────────────┐ │
  // │ │ len(str_1) <uvarint> │ str_1 <bytes> │ │
  // │ ├──────────────────────┴───────────────┤ │
  // │ │                . . .                 │ │
  // │ ├──────────────────────┬───────────────┤ │
  // │ │ len(str_n) <uvarint> │ str_n <bytes> │ │
  // │ └──────────────────────┴───────────────┘ │
  // ├──────────────────────────────────────────┤
  // │ CRC32 <4b>                               │
  // └──────────────────────────────────────────┘
  base::Status read_symbols();

  // ┌─────────────────────┬────────────────────┐
  // │ len <4b>            │ #entries <4b>      │
  // ├─────────────────────┴────────────────────┤
  // │ ┌──────────────────────────────────────┐ │
  // │ │  n = 2 <1b>                          │ │
  // │ ├──────────────────────┬───────────────┤ │
  // │ │ len(name) <uvarint>  │ name <bytes>  │ │
  // │ ├──────────────────────┼───────────────┤ │
  // │ │ len(value) <uvarint> │ value <bytes> │ │
  // │ ├──────────────────────┴───────────────┤ │
  // │ │  offset <uvarint64>                  │ │
  // │ └──────────────────────────────────────┘ │
  // │                  . . .                   │
  // ├──────────────────────────────────────────┤
  // │  CRC32 <4b>                              │
  // └──────────────────────────────────────────┘
  base::Status read_postings_table();

 public:
  static base::Status Open(std::unique_ptr<tsdbutil::RangedByteSource> &&b,
                           std::unique_ptr<IndexReader> *result);

  const std::vector<std::string> &symbols() const { return symbols_; }

  const TOC &toc() const { return toc_; }

  // ┌────────────────────┬────────────────────┐
  // │ len <4b>           │ #entries <4b>      │
  // ├────────────────────┴────────────────────┤
  // │ ┌─────────────────────────────────────┐ │
  // │ │ ref(series_1) <4b>                  │ │
  // │ ├─────────────────────────────────────┤ │
  // │ │ ...                                 │ │
  // │ ├─────────────────────────────────────┤ │
  // │ │ ref(series_n) <4b>                  │ │
  // │ └─────────────────────────────────────┘ │
  // ├─────────────────────────────────────────┤
  // │ CRC32 <4b>                              │
  // └─────────────────────────────────────────┘
  base::Status postings(const std::string &name, const std::string &value,
                        std::unique_ptr<PostingsInterface> *p) override;

  // ┌─────────────────────────────────────────────────────────────────────────┐
  // │ len <uvarint>                                                           │
  // ├─────────────────────────────────────────────────────────────────────────┤
  // │ ┌──────────────────┬──────────────────────────────────────────────────┐ │
  // │ │                  │ ┌──────────────────────────────────────────┐     │ │
  // │ │                  │ │ ref(l_i.name) <uvarint>                  │     │ │
  // │ │     #labels      │ ├──────────────────────────────────────────┤ ... │ │
  // │ │    <uvarint>     │ │ ref(l_i.value) <uvarint>                 │     │ │
  // │ │                  │ └──────────────────────────────────────────┘     │ │
  // │ ├──────────────────┼──────────────────────────────────────────────────┤ │
  // │ │                  │ ┌──────────────────────────────────────────┐     │ │
  // │ │                  │ │ c_0.mint <varint>                        │     │ │
  // │ │                  │ ├──────────────────────────────────────────┤     │ │
  // │ │                  │ │ c_0.maxt - c_0.mint <uvarint>            │     │ │
  // │ │                  │ ├──────────────────────────────────────────┤     │ │
  // │ │                  │ │ ref(c_0.data) <uvarint>                  │     │ │
  // │ │      #chunks     │ └──────────────────────────────────────────┘     │ │
  // │ │     <uvarint>    │ ┌──────────────────────────────────────────┐     │ │
  // │ │                  │ │ c_i.mint - c_i-1.maxt <uvarint>          │     │ │
  // │ │                  │ ├──────────────────────────────────────────┤     │ │
  // │ │                  │ │ c_i.maxt - c_i.mint <uvarint>            │     │ │
  // │ │                  │ ├──────────────────────────────────────────┤ ... │ │
  // │ │                  │ │ ref(c_i.data) - ref(c_i-1.data) <varint> │     │ │
  // │ │                  │ └──────────────────────────────────────────┘     │ │
  // │ └──────────────────┴──────────────────────────────────────────────────┘ │
  // ├─────────────────────────────────────────────────────────────────────────┤
  // │ CRC32 <4b>                                                              │
  // └─────────────────────────────────────────────────────────────────────────┘
  //
  // Reference is the offset of Series entry / 16, label refs are symbol
  // numbers.
  base::Status series(uint64_t ref, label::Labels *lset,
                      std::deque<chunk::ChunkMeta> *chunks) override;

  label::Label all_postings_key() const override;

  void close() override;

  uint64_t size() const;
};

}  // namespace index
}  // namespace tsdump

#endif
