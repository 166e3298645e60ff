// Demonstration of OptionCell<T> over existing Option<T> storage
// A table of variable bindings is filled once per slot through shared
// references, then handed back as plain options.

#include <iostream>
#include <span>
#include <string>
#include <vector>
#include <optcell/optcell.hpp>

using optcell::None;
using optcell::Option;
using optcell::OptionCell;

// Binds a variable unless it already has a value. The table is only
// borrowed immutably: OptionCell::set() is the one write it can perform.
void bind(std::span<const OptionCell<std::string>> vars, std::size_t index,
          std::string value) {
    auto result = vars[index].set(std::move(value));
    if (result.is_ok()) {
        std::cout << "  x" << index << " := " << vars[index].get().unwrap() << "\n";
    } else {
        std::cout << "  x" << index << " already bound to "
                  << vars[index].get().unwrap() << ", rejected "
                  << result.unwrap_err().value << "\n";
    }
}

// @safe
int main() {
    std::cout << "Binding variables through OptionCell...\n\n";

    std::vector<Option<std::string>> bindings{None, optcell::Some(std::string("int")), None};

    {
        std::span<OptionCell<std::string>> vars = optcell::cells_from_mut_slice(bindings);
        std::span<const OptionCell<std::string>> shared = vars;

        bind(shared, 0, "bool");
        bind(shared, 1, "float");
        bind(shared, 0, "char");
    }

    std::cout << "\nFinal bindings:\n";
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        std::cout << "  x" << i << " = ";
        if (bindings[i].is_some()) {
            std::cout << bindings[i].as_ref().unwrap() << "\n";
        } else {
            std::cout << "<unbound>\n";
        }
    }

    // The options are plain Option<T> again and may be cleared freely
    bindings[1] = None;
    std::cout << "\nx1 cleared: " << (bindings[1].is_none() ? "yes" : "no") << "\n";

    return 0;
}
