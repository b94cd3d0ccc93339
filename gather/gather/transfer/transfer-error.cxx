#include <gather/transfer/transfer-error.hxx>

using namespace std;

namespace gather
{
  ostream&
  operator<< (ostream& os, transfer_error_kind k)
  {
    switch (k)
    {
    case transfer_error_kind::transport:         return os << "transport";
    case transfer_error_kind::size_mismatch:     return os << "size mismatch";
    case transfer_error_kind::checksum_mismatch: return os << "checksum mismatch";
    case transfer_error_kind::no_viable_source:  return os << "no viable source";
    case transfer_error_kind::exhausted_source:  return os << "exhausted sources";
    case transfer_error_kind::storage:           return os << "storage";
    case transfer_error_kind::cancelled:         return os << "cancelled";
    }
    return os;
  }

  size_mismatch_error::
  size_mismatch_error (uint64_t expected, uint64_t actual)
    : transfer_error (transfer_error_kind::size_mismatch,
                      "size mismatch: expected " + std::to_string (expected) +
                      " bytes, got " + std::to_string (actual)),
      expected_ (expected),
      actual_ (actual)
  {
  }

  checksum_mismatch_error::
  checksum_mismatch_error (const string& expected, const string& actual)
    : transfer_error (transfer_error_kind::checksum_mismatch,
                      "checksum mismatch: expected " + expected +
                      ", found " + actual)
  {
  }
}
