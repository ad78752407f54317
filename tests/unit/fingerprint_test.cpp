#include "internal/util/fingerprint.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using colguard::util::Fingerprinter;
using colguard::util::Sha256Hex;

void TestKnownDigests() {
  assert(Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

void TestFieldBoundariesChangeDigest() {
  Fingerprinter a;
  a.Add("ab").Add("c");

  Fingerprinter b;
  b.Add("a").Add("bc");

  const auto da = a.HexDigest();
  const auto db = b.HexDigest();
  assert(da.size() == 64);
  assert(da != db);
}

void TestDigestIsDeterministic() {
  Fingerprinter a;
  a.Add("select 1").Add("orders");
  Fingerprinter b;
  b.Add("select 1").Add("orders");
  assert(a.HexDigest() == b.HexDigest());
}

void TestAddAfterDigestThrows() {
  Fingerprinter fp;
  fp.Add("x");
  (void)fp.HexDigest();

  bool threw = false;
  try {
    fp.Add("y");
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw && "Fingerprinter must reject writes after finalization.");
}

} // namespace

int main() {
  TestKnownDigests();
  TestFieldBoundariesChangeDigest();
  TestDigestIsDeterministic();
  TestAddAfterDigestThrows();

  std::cout << "colguard_unit_fingerprint: pass\n";
  return 0;
}
