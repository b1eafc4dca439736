#include "internal/sweep/token_mutator.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <unordered_set>

#include "internal/util/uuid.hpp"

namespace {

using rowsweep::db::model::TicketRecord;
using rowsweep::sweep::TokenMutator;

void TestApplyReplacesTokenAndKeepsId() {
  TokenMutator mutator;
  TicketRecord before{42, "00000000-0000-4000-8000-000000000000"};

  auto after = mutator.Apply(before);
  assert(after.id == 42);
  assert(after.token != before.token);
  assert(rowsweep::util::IsCanonicalUUID(after.token));
}

void TestTokensAreVersion4() {
  for (int i = 0; i < 100; ++i) {
    const auto token = TokenMutator::NewToken();
    assert(token.size() == 36);
    assert(token[14] == '4');
    assert(token[19] == '8' || token[19] == '9' || token[19] == 'a' || token[19] == 'b');
  }
}

void TestReapplyingYieldsAnotherValidToken() {
  TokenMutator mutator;
  TicketRecord record{7, "seed"};

  auto once  = mutator.Apply(record);
  auto twice = mutator.Apply(once);

  assert(twice.id == 7);
  assert(twice.token != once.token);
  assert(rowsweep::util::IsCanonicalUUID(twice.token));
}

void TestTokensDoNotCollide() {
  std::unordered_set<std::string> seen;
  for (int i = 0; i < 100000; ++i) {
    assert(seen.insert(TokenMutator::NewToken()).second);
  }
}

void TestUuidStringRoundTrip() {
  const auto id   = rowsweep::util::GenerateUUID();
  const auto text = rowsweep::util::ToString(id);
  assert(rowsweep::util::FromString(text) == id);
  assert(!rowsweep::util::IsCanonicalUUID("not-a-uuid"));
  assert(!rowsweep::util::IsCanonicalUUID("0000000000004000800000000000000000ab"));
}

} // namespace

int main() {
  TestApplyReplacesTokenAndKeepsId();
  TestTokensAreVersion4();
  TestReapplyingYieldsAnotherValidToken();
  TestTokensDoNotCollide();
  TestUuidStringRoundTrip();

  std::cout << "rowsweep_unit_token_mutator: pass\n";
  return 0;
}
