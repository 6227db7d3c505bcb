/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

#pragma once

#include <fmt/format.h>
#include <glog/logging.h>

#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

class [[nodiscard]] Status {
 public:
  enum Code : unsigned char {
    cOK = 0,
    NotOK,
    InvalidArgument,
    IncompatiblePrecision,
  };

  Status() = default;
  Status(Code code, std::string msg = {})  // NOLINT
      : impl_(code == cOK ? nullptr : std::make_unique<Impl>(Impl{code, std::move(msg)})) {}

  Status(const Status& s) : impl_(s.impl_ ? std::make_unique<Impl>(*s.impl_) : nullptr) {}
  Status(Status&&) = default;

  Status& operator=(const Status& s) {
    if (this != &s) {
      impl_ = s.impl_ ? std::make_unique<Impl>(*s.impl_) : nullptr;
    }
    return *this;
  }
  Status& operator=(Status&&) = default;

  ~Status() = default;

  static Status OK() { return {}; }

  bool IsOK() const { return !impl_; }
  explicit operator bool() const { return IsOK(); }

  template <Code code>
  bool Is() const {
    return GetCode() == code;
  }

  Code GetCode() const { return impl_ ? impl_->code : cOK; }

  std::string Msg() const& { return impl_ ? impl_->msg : "ok"; }
  std::string Msg() && { return impl_ ? std::move(impl_->msg) : "ok"; }

  std::string ToString() const {
    if (IsOK()) {
      return "ok";
    }
    return fmt::format("{{code: {}, msg: {}}}", static_cast<int>(impl_->code), impl_->msg);
  }

 private:
  struct Impl {
    Code code;
    std::string msg;
  };

  // nullptr means ok, so a successful status costs one pointer
  std::unique_ptr<Impl> impl_;
};

template <typename T>
class [[nodiscard]] StatusOr {
 public:
  using value_type = T;

  StatusOr(Status s) : value_or_error_(std::move(s)) {  // NOLINT
    CHECK(!std::get<Status>(value_or_error_).IsOK()) << "a StatusOr cannot be constructed from an ok status";
  }
  StatusOr(Status::Code code, std::string msg = {}) : StatusOr(Status(code, std::move(msg))) {}  // NOLINT

  template <typename... Ts, std::enable_if_t<std::is_constructible_v<T, Ts&&...>, int> = 0>
  StatusOr(Ts&&... args) : value_or_error_(std::in_place_index<0>, std::forward<Ts>(args)...) {}  // NOLINT

  StatusOr(const StatusOr&) = default;
  StatusOr(StatusOr&&) = default;
  StatusOr& operator=(const StatusOr&) = default;
  StatusOr& operator=(StatusOr&&) = default;

  bool IsOK() const { return value_or_error_.index() == 0; }
  explicit operator bool() const { return IsOK(); }

  Status::Code GetCode() const { return IsOK() ? Status::cOK : error().GetCode(); }

  std::string Msg() const { return IsOK() ? "ok" : error().Msg(); }

  Status ToStatus() const& { return IsOK() ? Status::OK() : error(); }
  Status ToStatus() && { return IsOK() ? Status::OK() : std::move(std::get<Status>(value_or_error_)); }

  T& GetValue() & {
    CHECK(IsOK()) << "value accessed on an error status: " << error().Msg();
    return std::get<0>(value_or_error_);
  }
  const T& GetValue() const& {
    CHECK(IsOK()) << "value accessed on an error status: " << error().Msg();
    return std::get<0>(value_or_error_);
  }
  T&& GetValue() && {
    CHECK(IsOK()) << "value accessed on an error status: " << error().Msg();
    return std::move(std::get<0>(value_or_error_));
  }

  T& operator*() & { return GetValue(); }
  const T& operator*() const& { return GetValue(); }
  T&& operator*() && { return std::move(*this).GetValue(); }

  T* operator->() { return &GetValue(); }
  const T* operator->() const { return &GetValue(); }

 private:
  const Status& error() const { return std::get<Status>(value_or_error_); }

  std::variant<T, Status> value_or_error_;
};
