/* Copyright (C) 2023 Andrew D. Smith
 *
 * Authors: Andrew Smith
 *
 * This program is free software: you can redistribute it and/or
 * modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 */

#ifndef SRC_SFBIAS_ERROR_HPP_
#define SRC_SFBIAS_ERROR_HPP_

#include <gsl/gsl_errno.h>

#include <sstream>
#include <stdexcept>
#include <string>

struct sfbias_error : public std::exception {
  int err{};             // status code from GSL
  std::string msg;       // the message
  std::string the_what;  // to report
  sfbias_error(const int err, const std::string &msg) : err{err}, msg{msg} {
    std::ostringstream oss;
    // clang-format off
    oss << "[error: " << err << "]"
        << "[GSL: " << gsl_strerror(err) << "][" << msg << "]";
    // clang-format on
    the_what = oss.str();
  }
  explicit sfbias_error(const std::string &_msg) :
    sfbias_error(GSL_FAILURE, _msg) {}
  const char *what() const noexcept override { return the_what.data(); }
};

#endif  // SRC_SFBIAS_ERROR_HPP_
