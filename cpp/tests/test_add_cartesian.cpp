#include "vector_math.h"
#include <iostream>
#include <iomanip>
#include <cassert>
#include <array>
#include <deque>
#include <vector>

using namespace vector_math;

namespace {
void print(const char* label, const Vector& v) {
    std::cout << "  " << label << ": (";
    for (size_t i = 0; i < v.size(); ++i) {
        std::cout << (i ? ", " : "") << v[i];
    }
    std::cout << ")" << std::endl;
}
}  // namespace

void testSameDimension() {
    std::cout << "Testing addition of same-dimension vectors..." << std::endl;

    Vector sum = VectorMath::addCartesian({Vector{1.0, 2.0}});
    print("(1, 2)", sum);
    assert((sum == Vector{1.0, 2.0}));

    sum = VectorMath::addCartesian({Vector{1.0, 2.0}, Vector{3.0, 4.0}});
    print("(1, 2) + (3, 4)", sum);
    assert((sum == Vector{4.0, 6.0}));

    sum = VectorMath::addCartesian({Vector{1.0, 2.0}, Vector{3.0, 4.0}, Vector{-5.0, 0.5}});
    assert((sum == Vector{-1.0, 6.5}));

    sum = VectorMath::addCartesian({Vector{1.0, 2.0, 3.0}, Vector{4.0, 5.0, 6.0}});
    print("(1, 2, 3) + (4, 5, 6)", sum);
    assert((sum == Vector{5.0, 7.0, 9.0}));

    std::cout << "  ✓ Same-dimension addition tests passed!" << std::endl;
}

void testDimensionMismatch() {
    std::cout << "Testing addition with dimension mismatch..." << std::endl;

    assert(VectorMath::addCartesian({Vector{1.0, 2.0}, Vector{3.0, 4.0, 5.0}}).empty());
    assert(VectorMath::addCartesian({Vector{1.0, 2.0, 3.0}, Vector{4.0, 5.0}}).empty());

    // Base dimension 2: z of later operands is dropped
    Vector sum = VectorMath::addCartesian({Vector{1.0, 2.0}, Vector{3.0, 4.0, 5.0}}, true);
    print("(1, 2) + (3, 4, 5), fixed", sum);
    assert((sum == Vector{4.0, 6.0}));

    // Base dimension 3: 2D operands count as z = 0
    sum = VectorMath::addCartesian({Vector{1.0, 2.0, 3.0}, Vector{4.0, 5.0}}, true);
    print("(1, 2, 3) + (4, 5), fixed", sum);
    assert((sum == Vector{5.0, 7.0, 3.0}));

    sum = VectorMath::addCartesian({Vector{1.0, 2.0, 3.0}, Vector{4.0, 5.0}, Vector{1.0, 1.0, 1.0}}, true);
    assert((sum == Vector{6.0, 8.0, 4.0}));

    std::cout << "  ✓ Dimension mismatch tests passed!" << std::endl;
}

void testInvalidOperands() {
    std::cout << "Testing addition with invalid operands..." << std::endl;

    assert(VectorMath::addCartesian({}).empty());
    assert(VectorMath::addCartesian({Vector{1.0}}).empty());
    assert(VectorMath::addCartesian({Vector{1.0, 2.0, 3.0, 4.0}}).empty());
    assert(VectorMath::addCartesian({Vector{1.0}, Vector{1.0, 2.0}}).empty());
    assert(VectorMath::addCartesian({Vector{1.0, 2.0}, Vector{1.0, 2.0, 3.0, 4.0}}, true).empty());
    assert(VectorMath::addCartesian({Vector{1.0, 2.0}, Vector{3.0, 4.0}, Vector{}}).empty());

    std::cout << "  ✓ Invalid operand tests passed!" << std::endl;
}

void testInputsUnchanged() {
    std::cout << "Testing that operands are not modified..." << std::endl;

    const Vector a{1.0, 2.0, 3.0};
    const Vector b{4.0, 5.0};
    const std::vector<Vector> operands{a, b};

    Vector sum = VectorMath::addCartesian(operands, true);
    assert((sum == Vector{5.0, 7.0, 3.0}));
    assert(operands[0] == a);
    assert(operands[1] == b);

    // Single operand comes back as an independent copy
    Vector single = VectorMath::addCartesian({a});
    single[0] = 100.0;
    assert(a[0] == 1.0);

    std::cout << "  ✓ Operand immutability tests passed!" << std::endl;
}

void testGenericOperands() {
    std::cout << "Testing addition of non-Vector operands..." << std::endl;

    const std::vector<std::array<double, 2>> pairs{{1.0, 2.0}, {3.0, 4.0}};
    Vector sum = VectorMath::addCartesian(pairs);
    print("array (1, 2) + (3, 4)", sum);
    assert((sum == Vector{4.0, 6.0}));

    const std::deque<std::vector<int>> mixed{{1, 2, 3}, {4, 5}};
    assert(VectorMath::addCartesian(mixed).empty());
    sum = VectorMath::addCartesian(mixed, true);
    assert((sum == Vector{5.0, 7.0, 3.0}));

    const std::array<std::array<double, 4>, 2> tooLong{};
    assert(VectorMath::addCartesian(tooLong).empty());

    bool thrown = false;
    try {
        VectorMath::addCartesianStrict(mixed);
    } catch (const DimensionMismatchError& e) {
        assert(e.expected() == 3);
        assert(e.actual() == 2);
        thrown = true;
    }
    assert(thrown);

    std::cout << "  ✓ Non-Vector operand tests passed!" << std::endl;
}

void testStrictAddition() {
    std::cout << "Testing strict addition..." << std::endl;

    Vector sum = VectorMath::addCartesianStrict({Vector{1.0, 2.0}, Vector{3.0, 4.0}});
    assert((sum == Vector{4.0, 6.0}));

    sum = VectorMath::addCartesianStrict({Vector{1.0, 2.0}, Vector{3.0, 4.0, 5.0}}, true);
    assert((sum == Vector{4.0, 6.0}));

    bool thrown = false;
    try {
        VectorMath::addCartesianStrict({Vector{1.0, 2.0}, Vector{3.0, 4.0, 5.0}});
    } catch (const DimensionMismatchError& e) {
        std::cout << "  Caught: " << e.what() << std::endl;
        assert(e.expected() == 2);
        assert(e.actual() == 3);
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        VectorMath::addCartesianStrict({Vector{1.0, 2.0}, Vector{1.0}});
    } catch (const InvalidVectorError& e) {
        std::cout << "  Caught: " << e.what() << std::endl;
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        VectorMath::addCartesianStrict({});
    } catch (const InvalidVectorError&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "  ✓ Strict addition tests passed!" << std::endl;
}

int main() {
    std::cout << std::fixed << std::setprecision(6);
    std::cout << "=== VectorMath Addition Tests ===" << std::endl << std::endl;

    try {
        testSameDimension();
        std::cout << std::endl;

        testDimensionMismatch();
        std::cout << std::endl;

        testInvalidOperands();
        std::cout << std::endl;

        testInputsUnchanged();
        std::cout << std::endl;

        testGenericOperands();
        std::cout << std::endl;

        testStrictAddition();
        std::cout << std::endl;

        std::cout << "=== All tests passed! ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
