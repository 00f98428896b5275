#pragma once

#include <streambuf>

namespace beam_analysis::runner {

// Duplicates everything written to it into two stream buffers
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace beam_analysis::runner
