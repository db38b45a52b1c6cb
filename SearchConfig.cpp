#include "SearchConfig.h"
#include <stdexcept>

using namespace std;

void SearchConfig::validate() const {
    if (!(timeLimitSeconds > 0.0)) throw invalid_argument("El limite de tiempo debe ser positivo");
    if (maxNodes == 0 || maxNodes < -1) throw invalid_argument("El limite de nodos debe ser positivo o -1");
    if (relativeGap < 0.0 || relativeGap >= 1.0) throw invalid_argument("El gap relativo debe estar en [0, 1)");
}
