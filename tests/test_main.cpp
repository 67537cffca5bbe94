#define BOOST_TEST_MODULE SplitLedger Tests
#include <boost/test/unit_test.hpp>
