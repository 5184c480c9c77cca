#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK
#endif
#define BOOST_TEST_MODULE lrr_client_tests

#include <boost/test/unit_test.hpp>
