#include "test.h"

int test_resource_ledger();
int test_probability();
int test_intel_store();
int test_action_validator();
int test_crew();
int test_round_machine();
int test_session();
int test_session_config();
int test_serialization();
int test_crew_host();
int test_event_export();
int test_json_errors();
int test_file_io();
int test_log();

int main() {
  int fails = 0;
  fails += test_resource_ledger();
  fails += test_probability();
  fails += test_intel_store();
  fails += test_action_validator();
  fails += test_crew();
  fails += test_round_machine();
  fails += test_session();
  fails += test_session_config();
  fails += test_serialization();
  fails += test_crew_host();
  fails += test_event_export();
  fails += test_json_errors();
  fails += test_file_io();
  fails += test_log();

  if (fails == 0) {
    std::cout << "All tests passed\n";
    return 0;
  }
  std::cerr << fails << " tests failed\n";
  return 1;
}
