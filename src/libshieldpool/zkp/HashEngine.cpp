#include "HashEngine.h"
#include "ZkError.h"
#include <array>
#include <stdexcept>

namespace shieldpool {
namespace zkp {

namespace {

constexpr size_t FIELD_BITS = 254;
constexpr size_t FULL_ROUNDS = 8;
constexpr size_t PARTIAL_ROUNDS_T3 = 57;
constexpr size_t PARTIAL_ROUNDS_T5 = 60;

/**
 * Grain LFSR in self-shrinking mode, as used by the Poseidon reference
 * implementation to generate round constants and the MDS matrix.
 */
class GrainLfsr {
public:
    GrainLfsr(size_t fieldBits, size_t width, size_t fullRounds, size_t partialRounds) {
        size_t pos = 0;
        auto push = [&](size_t value, size_t bits) {
            for (size_t i = bits; i-- > 0;)
                state_[pos++] = ((value >> i) & 1) != 0;
        };

        push(1, 2);          // prime field
        push(0, 4);          // x^alpha S-box
        push(fieldBits, 12);
        push(width, 12);
        push(fullRounds, 10);
        push(partialRounds, 10);
        push((1u << 30) - 1, 30);

        for (int i = 0; i < 160; ++i)
            step();
    }

    bool nextBit() {
        for (;;) {
            bool const keep = step();
            bool const bit = step();
            if (keep)
                return bit;
        }
    }

    // Big-endian 256-bit buffer holding the next `bits` output bits.
    uint256 nextValue(size_t bits) {
        Bytes32 out{};
        size_t const offset = 256 - bits;
        for (size_t k = 0; k < bits; ++k) {
            if (nextBit()) {
                size_t const p = offset + k;
                out[p / 8] |= static_cast<std::uint8_t>(0x80 >> (p % 8));
            }
        }
        return uint256::fromVoid(out.data());
    }

private:
    bool at(size_t i) const { return state_[(head_ + i) % state_.size()]; }

    bool step() {
        bool const bit = at(62) ^ at(51) ^ at(38) ^ at(23) ^ at(13) ^ at(0);
        state_[head_] = bit;
        head_ = (head_ + 1) % state_.size();
        return bit;
    }

    std::array<bool, 80> state_{};
    size_t head_ = 0;
};

PoseidonParameters generate(size_t width, size_t partialRounds) {
    PoseidonParameters p;
    p.width = width;
    p.fullRounds = FULL_ROUNDS;
    p.partialRounds = partialRounds;

    GrainLfsr grain(FIELD_BITS, width, FULL_ROUNDS, partialRounds);

    size_t const count = (FULL_ROUNDS + partialRounds) * width;
    p.roundConstants.reserve(count);
    while (p.roundConstants.size() < count) {
        auto const candidate = grain.nextValue(FIELD_BITS);
        if (field::isCanonical(candidate))
            p.roundConstants.push_back(field::fromUint256(candidate));
    }

    std::vector<FieldT> xs, ys;
    for (size_t i = 0; i < width; ++i)
        xs.push_back(field::reduce(grain.nextValue(FIELD_BITS)));
    for (size_t i = 0; i < width; ++i)
        ys.push_back(field::reduce(grain.nextValue(FIELD_BITS)));

    // Cauchy matrix M[i][j] = 1 / (x_i + y_j)
    p.mds.assign(width, std::vector<FieldT>(width));
    for (size_t i = 0; i < width; ++i) {
        for (size_t j = 0; j < width; ++j) {
            auto const sum = xs[i] + ys[j];
            if (sum.is_zero())
                throw std::runtime_error("Poseidon: degenerate MDS matrix");
            p.mds[i][j] = sum.inverse();
        }
    }
    return p;
}

inline FieldT sbox(FieldT const& x) {
    auto const x2 = x.squared();
    return x2.squared() * x;
}

} // namespace

HashEngine::HashEngine(std::string parameterSet)
    : parameterSet_(std::move(parameterSet)) {
    initCurveParameters();
}

void HashEngine::initialize() {
    std::call_once(once_, [this] {
        if (parameterSet_ != circomParameterSet) {
            throw std::invalid_argument("Unsupported hash parameter set: " + parameterSet_);
        }
        derive();
        checkKnownAnswers();
        initialized_.store(true, std::memory_order_release);
    });
}

std::future<void> HashEngine::initializeAsync() {
    return std::async(std::launch::async, [this] { initialize(); });
}

void HashEngine::derive() {
    t3_ = generate(3, PARTIAL_ROUNDS_T3);
    t5_ = generate(5, PARTIAL_ROUNDS_T5);
}

void HashEngine::checkKnownAnswers() const {
    struct KnownAnswer {
        std::vector<std::uint64_t> inputs;
        char const* expected;
    };

    // Outputs of the circomlib Poseidon circuit for the same inputs.
    static std::array<KnownAnswer, 3> const answers{{
        {{1, 2}, "7853200120776062878684798364095072458815029376092732009249414926327459813530"},
        {{0, 0}, "14744269619966411208579211824598458697587494354926760081771325075741142829156"},
        {{1, 2, 3, 4}, "18821383157269793795438455681495246036402687001665670618754263018637548127333"},
    }};

    for (auto const& answer : answers) {
        std::vector<FieldT> inputs;
        for (auto v : answer.inputs)
            inputs.push_back(field::fromUint64(v));

        auto const& params = inputs.size() == 2 ? t3_ : t5_;
        if (field::toDecimal(permute(params, inputs)) != answer.expected) {
            throw std::runtime_error(
                "Hash engine known-answer check failed for parameter set " + parameterSet_);
        }
    }
}

PoseidonParameters const& HashEngine::parameters(size_t arity) const {
    if (!isInitialized())
        throw NotInitializedError("Hash engine used before initialization");

    switch (arity) {
        case 2:
            return t3_;
        case 4:
            return t5_;
        default:
            throw std::invalid_argument("Unsupported hash arity: " + std::to_string(arity));
    }
}

FieldT HashEngine::hash2(FieldT const& a, FieldT const& b) const {
    return permute(parameters(2), {a, b});
}

FieldT HashEngine::hash4(FieldT const& a, FieldT const& b, FieldT const& c, FieldT const& d) const {
    return permute(parameters(4), {a, b, c, d});
}

FieldT HashEngine::hash(std::vector<FieldT> const& inputs) const {
    return permute(parameters(inputs.size()), inputs);
}

FieldT HashEngine::permute(PoseidonParameters const& params, std::vector<FieldT> const& inputs) const {
    size_t const t = params.width;
    size_t const halfFull = params.fullRounds / 2;

    std::vector<FieldT> state;
    state.reserve(t);
    state.push_back(FieldT::zero());
    state.insert(state.end(), inputs.begin(), inputs.end());

    std::vector<FieldT> mixed(t);
    size_t const rounds = params.fullRounds + params.partialRounds;
    for (size_t r = 0; r < rounds; ++r) {
        for (size_t i = 0; i < t; ++i)
            state[i] += params.roundConstants[r * t + i];

        if (r < halfFull || r >= halfFull + params.partialRounds) {
            for (auto& x : state)
                x = sbox(x);
        } else {
            state[0] = sbox(state[0]);
        }

        for (size_t i = 0; i < t; ++i) {
            FieldT acc = FieldT::zero();
            for (size_t j = 0; j < t; ++j)
                acc += params.mds[i][j] * state[j];
            mixed[i] = acc;
        }
        state.swap(mixed);
    }

    return state[0];
}

} // namespace zkp
} // namespace shieldpool
