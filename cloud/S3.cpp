#include "cloud/S3.hpp"

#include <aws/core/config/AWSProfileConfigLoader.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/s3/model/BucketLocationConstraint.h>
#include <aws/s3/model/GetBucketLocationRequest.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>

#include <cstdlib>

namespace tsdump {
namespace cloud {

bool S3Options::GetNameFromEnvironment(const char* name, const char* alt,
                                       std::string* result) {
  char* value = getenv(name);  // See if name is set in the environment
  if (value == nullptr &&
      alt != nullptr) {   // Not set.  Do we have an alt name?
    value = getenv(alt);  // See if alt is in the environment
  }
  if (value != nullptr && value[0] != '\0') {
    result->assign(value);
    return true;
  }
  return false;
}

void AwsCloudAccessCredentials::InitializeProfile(
    const std::string& profile_name) {
  profile = profile_name;
  type = profile_name.empty() ? AwsAccessType::kUndefined
                              : AwsAccessType::kConfig;
}

base::Status AwsCloudAccessCredentials::GetCredentialsProvider(
    std::shared_ptr<Aws::Auth::AWSCredentialsProvider>* result) const {
  result->reset();
  switch (type) {
    case AwsAccessType::kConfig:
      if (profile.empty()) {
        return base::Status::InvalidArgument(
            "AWS profile credentials require a profile name");
      }
      result->reset(new Aws::Auth::ProfileConfigFileAWSCredentialsProvider(
          profile.c_str()));
      break;
    case AwsAccessType::kUndefined:
      // Use AWS SDK's default credential chain
      break;
  }
  return base::Status::OK();
}

base::Status S3ErrorToStatus(
    const Aws::Client::AWSError<Aws::S3::S3Errors>& error,
    const std::string& what) {
  std::string errmsg(error.GetMessage().c_str(), error.GetMessage().size());
  if (errmsg.empty()) {
    errmsg = std::string(error.GetExceptionName().c_str(),
                         error.GetExceptionName().size());
  }
  Aws::S3::S3Errors s3err = error.GetErrorType();
  Aws::Http::HttpResponseCode code = error.GetResponseCode();
  if (s3err == Aws::S3::S3Errors::NO_SUCH_BUCKET ||
      s3err == Aws::S3::S3Errors::NO_SUCH_KEY ||
      s3err == Aws::S3::S3Errors::RESOURCE_NOT_FOUND ||
      code == Aws::Http::HttpResponseCode::NOT_FOUND ||
      errmsg.find("Response code: 404") != std::string::npos) {
    return base::Status::NotFound(what, errmsg);
  }
  if (s3err == Aws::S3::S3Errors::REQUEST_TIMEOUT ||
      code == Aws::Http::HttpResponseCode::REQUEST_TIMEOUT ||
      code == Aws::Http::HttpResponseCode::GATEWAY_TIMEOUT ||
      errmsg.find("Timeout") != std::string::npos ||
      errmsg.find("timed out") != std::string::npos) {
    return base::Status::TimedOut(what, errmsg);
  }
  return base::Status::IOError(what, errmsg);
}

std::string RegionFromLocationConstraint(const std::string& constraint) {
  // Buckets in us-east-1 report no constraint, old eu-west-1 buckets "EU".
  if (constraint.empty()) return "us-east-1";
  if (constraint == "EU") return "eu-west-1";
  return constraint;
}

S3Wrapper::S3Wrapper(const S3Options& options) : options_(options) {
  Aws::InitAPI(Aws::SDKOptions());

  status_ = options_.credentials.GetCredentialsProvider(&creds_);
  if (!status_.ok()) {
    status_ = status_.Wrap("aws credentials");
    LOG_DEBUG << "[aws] S3Wrapper - Bad AWS credentials " << status_;
    return;
  }

  status_ = ResolveRegion();
  if (!status_.ok()) {
    status_ = status_.Wrap("resolve aws region");
    LOG_DEBUG << "[aws] S3Wrapper unable to resolve region " << status_;
    return;
  }

  LOG_DEBUG << "      S3Wrapper.region: " << region_;
  LOG_DEBUG << "      S3Wrapper.profile: " << options_.credentials.profile;
  LOG_DEBUG << "      S3Wrapper.credentials: "
            << (creds_ ? "[given]" : "[default chain]");
  LOG_DEBUG << "      S3Wrapper.request_timeout_ms: "
            << options_.request_timeout_ms;

  status_ = NewClient(region_, &s3client_);
  if (!status_.ok()) {
    status_ = status_.Wrap("create s3 client");
    LOG_DEBUG << "[aws] S3Wrapper unable to create client " << status_;
  }
}

base::Status S3Wrapper::NewClient(
    const std::string& region,
    std::shared_ptr<Aws::S3::S3Client>* client) const {
  // create AWS S3 client with appropriate timeouts
  Aws::Client::ClientConfiguration config;
  base::Status s =
      AwsCloudOptions::GetClientConfiguration(options_, region, &config);
  if (!s.ok()) return s;
  LOG_DEBUG << "[aws] S3Wrapper connection to endpoint in region: "
            << config.region.c_str();
  *client = creds_ ? std::make_shared<Aws::S3::S3Client>(creds_, config)
                   : std::make_shared<Aws::S3::S3Client>(config);
  return base::Status::OK();
}

base::Status S3Wrapper::ResolveRegion() {
  region_ = options_.region;
  if (!region_.empty()) return base::Status::OK();
  if (S3Options::GetNameFromEnvironment("AWS_DEFAULT_REGION", "AWS_REGION",
                                        &region_)) {
    return base::Status::OK();
  }
  if (GetRegionFromProfile(&region_)) return base::Status::OK();
  if (options_.probe_bucket.empty()) {
    return base::Status::InvalidArgument(
        "no AWS region configured and no bucket to probe");
  }
  return GetBucketRegion(options_.probe_bucket, &region_);
}

bool S3Wrapper::GetRegionFromProfile(std::string* region) const {
  Aws::String profile = options_.credentials.profile.empty()
                            ? Aws::Auth::GetConfigProfileName()
                            : ToAwsString(options_.credentials.profile);
  Aws::Config::AWSConfigFileProfileConfigLoader loader(
      Aws::Auth::GetConfigProfileFilename(), true);
  if (!loader.Load()) return false;
  const auto& profiles = loader.GetProfiles();
  auto it = profiles.find(profile);
  if (it == profiles.end() || it->second.GetRegion().empty()) return false;
  region->assign(it->second.GetRegion().c_str(),
                 it->second.GetRegion().size());
  LOG_DEBUG << "[aws] S3Wrapper region " << *region << " from profile "
            << profile.c_str();
  return true;
}

base::Status S3Wrapper::GetBucketRegion(const std::string& bucket,
                                        std::string* region) {
  // GetBucketLocation is answered by any region.
  std::shared_ptr<Aws::S3::S3Client> client;
  base::Status s = NewClient("us-east-1", &client);
  if (!s.ok()) return s;
  Aws::S3::Model::GetBucketLocationRequest request;
  request.SetBucket(ToAwsString(bucket));
  auto outcome = client->GetBucketLocation(request);
  if (!outcome.IsSuccess()) {
    return S3ErrorToStatus(outcome.GetError(), "locate bucket " + bucket);
  }
  Aws::S3::Model::BucketLocationConstraint constraint =
      outcome.GetResult().GetLocationConstraint();
  std::string name;
  if (constraint != Aws::S3::Model::BucketLocationConstraint::NOT_SET) {
    Aws::String n = Aws::S3::Model::BucketLocationConstraintMapper::
        GetNameForBucketLocationConstraint(constraint);
    name.assign(n.c_str(), n.size());
  }
  *region = RegionFromLocationConstraint(name);
  LOG_INFO << "[aws] S3Wrapper bucket " << bucket << " is in region "
           << *region;
  return base::Status::OK();
}

base::Status S3Wrapper::HeadObject(const std::string& bucket,
                                   const std::string& key, uint64_t* size) {
  if (!status_.ok()) return status_;
  Aws::S3::Model::HeadObjectRequest request;
  request.SetBucket(ToAwsString(bucket));
  request.SetKey(ToAwsString(key));

  LOG_DEBUG << "[s3] HeadObject s3://" << bucket << "/" << key;
  auto outcome = s3client_->HeadObject(request);
  if (!outcome.IsSuccess()) {
    base::Status s =
        S3ErrorToStatus(outcome.GetError(), "s3://" + bucket + "/" + key);
    LOG_DEBUG << "[s3] HeadObject failed " << s;
    return s;
  }
  *size = static_cast<uint64_t>(outcome.GetResult().GetContentLength());
  return base::Status::OK();
}

base::Status S3Wrapper::GetObject(const std::string& bucket,
                                  const std::string& key,
                                  const std::string& range, std::string* body) {
  body->clear();
  if (!status_.ok()) return status_;
  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(ToAwsString(bucket));
  request.SetKey(ToAwsString(key));
  if (!range.empty()) request.SetRange(ToAwsString(range));

  LOG_DEBUG << "[s3] GetObject s3://" << bucket << "/" << key << " " << range;
  auto outcome = s3client_->GetObject(request);
  if (!outcome.IsSuccess()) {
    base::Status s =
        S3ErrorToStatus(outcome.GetError(), "s3://" + bucket + "/" + key);
    LOG_DEBUG << "[s3] GetObject " << range << " failed " << s;
    return s;
  }

  // extract data payload
  Aws::IOStream& stream = outcome.GetResult().GetBody();
  size_t n = static_cast<size_t>(outcome.GetResult().GetContentLength());
  body->resize(n);
  if (n != 0) {
    stream.read(&(*body)[0], n);
    body->resize(static_cast<size_t>(stream.gcount()));
  }
  LOG_DEBUG << "[s3] GetObject s3://" << bucket << "/" << key << " read "
            << body->size() << " bytes";
  return base::Status::OK();
}

}  // namespace cloud.
}  // namespace tsdump.
