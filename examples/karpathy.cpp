#include "microrunn/microrunn.h"

int main() {
    mr::Value a(2.0), b(-3.0), c(10.0);

    auto f = mr::tanh(a * b + c);
    f.backward();

    std::cout << f.expression() << " = " << f.value() << std::endl;
    std::cout << "a " << a << std::endl;
    std::cout << "b " << b << std::endl;
    std::cout << "c " << c << std::endl;
}
