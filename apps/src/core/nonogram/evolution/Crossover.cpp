#include "Crossover.h"
#include "core/Assert.h"

#include <utility>

namespace NonoGen {

CandidateGrid uniformRowCrossover(
    const CandidateGrid& a, const CandidateGrid& b, std::mt19937& rng)
{
    NONOGEN_ASSERT(a.sameShape(b), "crossover parents must have the same dimensions");

    CandidateGrid child = a;
    std::bernoulli_distribution fromB(0.5);
    for (int y = 0; y < child.getHeight(); ++y) {
        if (fromB(rng)) {
            child.copyRowFrom(b, y);
        }
    }
    return child;
}

CandidateGrid twoPointRowCrossover(
    const CandidateGrid& a, const CandidateGrid& b, std::mt19937& rng)
{
    NONOGEN_ASSERT(a.sameShape(b), "crossover parents must have the same dimensions");

    const int height = a.getHeight();
    std::uniform_int_distribution<int> cutDist(0, height);
    int first = cutDist(rng);
    int last = cutDist(rng);
    while (first == last) {
        last = cutDist(rng);
    }
    if (first > last) {
        std::swap(first, last);
    }

    CandidateGrid child = a;
    for (int y = first; y < last; ++y) {
        child.copyRowFrom(b, y);
    }
    return child;
}

CandidateGrid crossover(
    const CandidateGrid& a, const CandidateGrid& b, CrossoverOperator op, std::mt19937& rng)
{
    switch (op) {
        case CrossoverOperator::UniformRows:
            return uniformRowCrossover(a, b, rng);
        case CrossoverOperator::TwoPointRows:
            return twoPointRowCrossover(a, b, rng);
        case CrossoverOperator::Mixed:
            break;
    }

    std::bernoulli_distribution useUniform(0.5);
    if (useUniform(rng)) {
        return uniformRowCrossover(a, b, rng);
    }
    return twoPointRowCrossover(a, b, rng);
}

} // namespace NonoGen
