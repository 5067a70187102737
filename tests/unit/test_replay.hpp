#pragma once

namespace clearledger::tests {

void test_replay_end_to_end();
void test_replay_aborts_on_malformed_line();
void test_replay_skips_malformed_lines();

}  // namespace clearledger::tests
