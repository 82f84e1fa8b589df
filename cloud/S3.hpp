#ifndef CLOUD_S3_HPP
#define CLOUD_S3_HPP

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/client/AWSError.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/client/RetryStrategy.h>
#include <aws/core/utils/Outcome.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>

#include <boost/noncopyable.hpp>
#include <memory>

#include "base/Logging.hpp"
#include "base/Status.hpp"
#include "cloud/ObjectStore.hpp"

namespace tsdump {
namespace cloud {

inline Aws::String ToAwsString(const std::string& s) {
  return Aws::String(s.data(), s.size());
}

// Type of AWS access credentials
enum class AwsAccessType {
  kUndefined,  // Use AWS SDK's default credential chain
  kConfig,     // Named profile of the shared credentials file
};

// Credentials needed to access AWS cloud service
class AwsCloudAccessCredentials {
 public:
  void InitializeProfile(const std::string& profile_name);

  // Get AWSCredentialsProvider to supply to AWS API calls when required (e.g.
  // to create S3Client). A null provider selects the default chain.
  base::Status GetCredentialsProvider(
      std::shared_ptr<Aws::Auth::AWSCredentialsProvider>* result) const;

 public:
  std::string profile;
  AwsAccessType type{AwsAccessType::kUndefined};
};

class S3Options {
 public:
  // Explicit region. Empty means: environment, then the profile, then a
  // GetBucketLocation probe on probe_bucket.
  std::string region;

  // Bucket used to discover the region when nothing else names one.
  std::string probe_bucket;

  // Access credentials
  AwsCloudAccessCredentials credentials;

  // Wall-clock bound of every request, 5 minutes by default.
  uint64_t request_timeout_ms = 300000;

  uint64_t connect_timeout_ms = 30000;

  // Number of retries of a failed request. 0 disables retries.
  long max_retries = 0;

  // Sets result based on the value of name or alt in the environment
  // Returns true if the name/alt exists in the environment, false otherwise
  static bool GetNameFromEnvironment(const char* name, const char* alt,
                                     std::string* result);
};

//
// Ability to configure retry policies for the AWS client
//
class AwsRetryStrategy : public Aws::Client::RetryStrategy {
 public:
  explicit AwsRetryStrategy(long max_retries) : max_retries_(max_retries) {
    default_strategy_ = std::make_shared<Aws::Client::DefaultRetryStrategy>();
    LOG_DEBUG << "[aws] Configured retry policy, max retries " << max_retries_;
  }

  ~AwsRetryStrategy() override {}

  // Returns true if the error can be retried given the error and the number of
  // times already tried.
  bool ShouldRetry(const Aws::Client::AWSError<Aws::Client::CoreErrors>& error,
                   long attemptedRetries) const override {
    if (attemptedRetries >= max_retries_) return false;
    const Aws::String errmsg = error.GetMessage();
    LOG_WARN << "[aws] Encountered S3 failure "
             << std::string(errmsg.c_str(), errmsg.size()) << " (code "
             << static_cast<int>(error.GetErrorType()) << ", http "
             << static_cast<int>(error.GetResponseCode()) << ") retry attempt "
             << attemptedRetries << " max retries " << max_retries_;
    return error.ShouldRetry();
  }

  // Calculates the time in milliseconds the client should sleep before
  // attempting another request based on the error and attemptedRetries count.
  long CalculateDelayBeforeNextRetry(
      const Aws::Client::AWSError<Aws::Client::CoreErrors>& error,
      long attemptedRetries) const override {
    return default_strategy_->CalculateDelayBeforeNextRetry(error,
                                                            attemptedRetries);
  }

 private:
  // The default strategy implemented by AWS client
  std::shared_ptr<Aws::Client::RetryStrategy> default_strategy_;

  const long max_retries_;
};

class AwsCloudOptions {
 public:
  static base::Status GetClientConfiguration(
      const S3Options& options, const std::string& region,
      Aws::Client::ClientConfiguration* config) {
    config->connectTimeoutMs = static_cast<long>(options.connect_timeout_ms);
    config->requestTimeoutMs = static_cast<long>(options.request_timeout_ms);
    config->httpRequestTimeoutMs =
        static_cast<long>(options.request_timeout_ms);

    // Setup how retries need to be done
    config->retryStrategy =
        std::make_shared<AwsRetryStrategy>(options.max_retries);

    config->region = ToAwsString(region);
    return base::Status::OK();
  }
};

// Translate an S3 error into the Status taxonomy: missing bucket or key is
// NotFound, deadline exceeded is TimedOut, anything else IOError.
base::Status S3ErrorToStatus(const Aws::Client::AWSError<Aws::S3::S3Errors>& error,
                             const std::string& what);

// Normalize a GetBucketLocation constraint name to a region.
std::string RegionFromLocationConstraint(const std::string& constraint);

class S3Wrapper : public ObjectStore, boost::noncopyable {
 public:
  explicit S3Wrapper(const S3Options& options);

  base::Status status() const { return status_; }

  const std::string& region() const { return region_; }

  // We cannot invoke Aws::ShutdownAPI from the destructor because there could
  // be multiple wrappers created by a process and Aws::ShutdownAPI should be
  // called only once by the entire process.
  static void Shutdown() { Aws::ShutdownAPI(Aws::SDKOptions()); }

  base::Status HeadObject(const std::string& bucket, const std::string& key,
                          uint64_t* size) override;

  base::Status GetObject(const std::string& bucket, const std::string& key,
                         const std::string& range, std::string* body) override;

 private:
  S3Options options_;
  base::Status status_;
  std::string region_;
  std::shared_ptr<Aws::Auth::AWSCredentialsProvider> creds_;
  std::shared_ptr<Aws::S3::S3Client> s3client_;

  base::Status ResolveRegion();
  bool GetRegionFromProfile(std::string* region) const;
  base::Status GetBucketRegion(const std::string& bucket, std::string* region);
  base::Status NewClient(const std::string& region,
                         std::shared_ptr<Aws::S3::S3Client>* client) const;
};

}  // namespace cloud.
}  // namespace tsdump.

#endif
