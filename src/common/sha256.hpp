// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef __COMMON_SHA256_HPP__
#define __COMMON_SHA256_HPP__

#include <string>

#include <stout/nothing.hpp>
#include <stout/try.hpp>

// Forward declaration to avoid pulling OpenSSL into every user.
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace bootsync {
namespace internal {

/**
 * Incremental SHA-256 digest.
 *
 * Usage:
 *   SHA256 digest;
 *   digest.update(chunk1);
 *   digest.update(chunk2);
 *   Try<std::string> hex = digest.hexdigest();
 *
 * `hexdigest` finalizes the digest; further updates fail.
 */
class SHA256
{
public:
  SHA256();
  ~SHA256();

  SHA256(const SHA256&) = delete;
  SHA256& operator=(const SHA256&) = delete;

  Try<Nothing> update(const std::string& data);

  // Returns the lower case hex encoded digest.
  Try<std::string> hexdigest();

private:
  EVP_MD_CTX* context;
  bool finalized;
};


// Returns the lower case hex encoded SHA-256 digest of `data`.
Try<std::string> sha256(const std::string& data);

} // namespace internal {
} // namespace bootsync {

#endif // __COMMON_SHA256_HPP__
