#pragma once

#include <stdexcept>
#include <string>

namespace huewire
{

// Base class for everything the codec rejects. Callers that only need
// "accept or reject" can catch this one type.
class Error : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

// A value lies outside its documented legal range (e.g. brightness 0 or 255).
class RangeError : public Error
{
   public:
    using Error::Error;
};

// The buffer ends before the fields announced by the flag word do.
class LengthError : public Error
{
   public:
    using Error::Error;
};

// A variable-length structure contradicts itself (gradient block size vs.
// color count), or text input is not valid hex.
class FormatError : public Error
{
   public:
    using Error::Error;
};

}  // namespace huewire
