#include "block/BlockLocation.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>

namespace tsdump {
namespace block {

const std::string INDEX_FILE_NAME = "index";

base::Status BlockLocation::Parse(const std::string &uri, BlockLocation *loc) {
  if (uri.empty()) return base::Status::InvalidArgument("empty block location");

  size_t p = uri.find("://");
  if (p == std::string::npos) {
    loc->kind = LocalBlock;
    loc->dir = uri;
    loc->bucket.clear();
    loc->prefix.clear();
    return base::Status::OK();
  }

  std::string scheme = uri.substr(0, p);
  if (scheme != "s3") {
    return base::Status::InvalidArgument("unsupported block location scheme",
                                         uri);
  }

  std::string rest = uri.substr(p + 3);
  size_t slash = rest.find('/');
  std::string bucket = rest.substr(0, slash);
  if (bucket.empty())
    return base::Status::InvalidArgument("missing bucket", uri);

  loc->kind = RemoteBlock;
  loc->dir.clear();
  loc->bucket = bucket;
  loc->prefix = slash == std::string::npos ? std::string()
                                           : rest.substr(slash + 1);
  boost::algorithm::trim_if(loc->prefix, boost::algorithm::is_any_of("/"));
  return base::Status::OK();
}

std::string BlockLocation::locator(const std::string &relative) const {
  if (kind == LocalBlock)
    return (boost::filesystem::path(dir) / relative).string();
  if (prefix.empty()) return relative;
  return prefix + "/" + relative;
}

std::string BlockLocation::to_string() const {
  if (kind == LocalBlock) return dir;
  if (prefix.empty()) return "s3://" + bucket;
  return "s3://" + bucket + "/" + prefix;
}

}  // namespace block
}  // namespace tsdump
