#pragma once

namespace lendcore::tests {

void test_journal_records();
void test_journal_corruption();
void test_snapshot_store();
void test_state_codec();
void test_persistence_replay();
void test_journal_failure_keeps_commits();

}  // namespace lendcore::tests
