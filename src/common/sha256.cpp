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

#include <openssl/evp.h>

#include <string>

#include <stout/error.hpp>

#include "common/sha256.hpp"

using std::string;

namespace bootsync {
namespace internal {

SHA256::SHA256()
  : context(EVP_MD_CTX_new()),
    finalized(false)
{
  if (context != nullptr &&
      EVP_DigestInit_ex(context, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(context);
    context = nullptr;
  }
}


SHA256::~SHA256()
{
  if (context != nullptr) {
    EVP_MD_CTX_free(context);
  }
}


Try<Nothing> SHA256::update(const string& data)
{
  if (context == nullptr) {
    return Error("Failed to initialize SHA-256 digest context");
  }

  if (finalized) {
    return Error("SHA-256 digest has already been finalized");
  }

  if (EVP_DigestUpdate(context, data.data(), data.size()) != 1) {
    return Error("Failed to update SHA-256 digest");
  }

  return Nothing();
}


Try<string> SHA256::hexdigest()
{
  if (context == nullptr) {
    return Error("Failed to initialize SHA-256 digest context");
  }

  if (finalized) {
    return Error("SHA-256 digest has already been finalized");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;

  if (EVP_DigestFinal_ex(context, digest, &length) != 1) {
    return Error("Failed to finalize SHA-256 digest");
  }

  finalized = true;

  static const char hex[] = "0123456789abcdef";

  string result;
  result.reserve(length * 2);
  for (unsigned int i = 0; i < length; i++) {
    result.push_back(hex[digest[i] >> 4]);
    result.push_back(hex[digest[i] & 0x0f]);
  }

  return result;
}


Try<string> sha256(const string& data)
{
  SHA256 digest;

  Try<Nothing> update = digest.update(data);
  if (update.isError()) {
    return Error(update.error());
  }

  return digest.hexdigest();
}

} // namespace internal {
} // namespace bootsync {
