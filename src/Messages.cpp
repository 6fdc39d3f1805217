#include "vecto/Messages.h"

namespace Vecto { namespace Messages
{
  Type OptStream::level_ = Default;
  Type OptStream::abort_level_ = DefaultAbort;
  std::ostream* OptStream::stream_ = &std::cerr;
}}
