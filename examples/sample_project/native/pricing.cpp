#include <vector>
#include "pricing.hpp"

struct Rule : public Policy {
    double apply(double price) const { return price; }
};

double best_price(const std::vector<double> &prices) {
    double best = 0.0;
    for (double p : prices) {
        if (best == 0.0 || p < best) {
            best = p;
        }
    }
    return best;
}
