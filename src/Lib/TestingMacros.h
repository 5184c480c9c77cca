//
// Accessors that are only compiled in for the test build
//

#ifndef LRR_CLIENT_TESTINGMACROS_H
#define LRR_CLIENT_TESTINGMACROS_H

#include <utility>

#ifdef BUILD_TESTS
// NOLINTBEGIN
#define EXPOSE_PROPERTY_FOR_TESTING(term) public: auto get##term () { return &term; } void set##term (decltype(term) value) { term = std::move(value); }
#define EXPOSE_PROPERTY_FOR_TESTING_READONLY(term) public: auto get##term () { return &term; }
// NOLINTEND
#else
#define EXPOSE_PROPERTY_FOR_TESTING(x)
#define EXPOSE_PROPERTY_FOR_TESTING_READONLY(x)
#endif

#endif //LRR_CLIENT_TESTINGMACROS_H
