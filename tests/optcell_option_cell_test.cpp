// Tests for optcell::OptionCell<T> - write-once cell with the layout of Option<T>
#include <optcell/option_cell.hpp>
#include <cassert>
#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace optcell;

// Counts destructions of values that still own their state.
// A moved-from Tracked is not counted, mirroring Rust's drop semantics.
struct Tracked {
    static int drops;

    int value;
    bool live;

    explicit Tracked(int v) : value(v), live(true) {}
    Tracked(const Tracked& other) : value(other.value), live(other.live) {}
    Tracked(Tracked&& other) noexcept : value(other.value), live(other.live) {
        other.live = false;
    }
    ~Tracked() {
        if (live) {
            ++drops;
        }
    }

    bool operator==(const Tracked& other) const { return value == other.value; }
};

int Tracked::drops = 0;

void test_new_get() {
    printf("test_new_get: ");
    {
        OptionCell<int> cell;
        assert(cell.is_empty());
        assert(!cell.is_filled());
        assert(cell.get().is_none());

        auto missing = cell.try_get();
        assert(missing.is_err());
        NotYetSet err = missing.unwrap_err();
        assert(std::string(err.what()) == "OptionCell is not yet set");

        auto other = OptionCell<int>::new_();
        assert(other.is_empty());

        OptionCell<int> from_none(None);
        assert(from_none.is_empty());
    }
    printf("PASS\n");
}

void test_set_get() {
    printf("test_set_get: ");
    {
        OptionCell<int> cell;
        const OptionCell<int>& ref1 = cell;
        const OptionCell<int>& ref2 = cell;
        const OptionCell<int>& ref3 = cell;

        assert(ref1.get().is_none());
        assert(ref2.set(42).is_ok());
        assert(ref3.get().unwrap() == 42);
        assert(ref3.try_get().unwrap() == 42);
        assert(cell.is_filled());
    }
    printf("PASS\n");
}

void test_set_rejected() {
    printf("test_set_rejected: ");
    {
        OptionCell<int> cell;
        cell.set(42).unwrap();

        auto result = cell.set(43);
        assert(result.is_err());
        AlreadySet<int> rejected = result.unwrap_err();
        assert(rejected.value == 43);
        assert(std::string(rejected.what()) == "OptionCell is already set");

        // State unchanged by the rejected write
        assert(cell.get().unwrap() == 42);
    }
    printf("PASS\n");
}

void test_set_rejected_returns_move_only_value() {
    printf("test_set_rejected_returns_move_only_value: ");
    {
        OptionCell<std::unique_ptr<int>> cell;
        cell.set(std::make_unique<int>(1)).unwrap();

        auto second = std::make_unique<int>(2);
        int* raw = second.get();
        auto result = cell.set(std::move(second));
        assert(result.is_err());

        std::unique_ptr<int> back = result.unwrap_err().value;
        assert(back.get() == raw);  // same allocation, not a copy
        assert(*back == 2);
        assert(*cell.get().unwrap() == 1);
    }
    printf("PASS\n");
}

void test_reference_stays_valid() {
    printf("test_reference_stays_valid: ");
    {
        OptionCell<std::string> cell;
        cell.set(std::string("first")).unwrap();

        const std::string& held = cell.get().unwrap();
        assert(cell.set(std::string("second")).is_err());

        // Rejected write did not touch the stored string
        assert(held == "first");
        assert(&held == &cell.get().unwrap());
    }
    printf("PASS\n");
}

void test_const_cell() {
    printf("test_const_cell: ");
    {
        const OptionCell<int> cell;
        assert(cell.set(7).is_ok());
        assert(cell.get().unwrap() == 7);
        assert(cell.set(8).is_err());
    }
    printf("PASS\n");
}

void test_get_or_init() {
    printf("test_get_or_init: ");
    {
        OptionCell<int> cell;
        int calls = 0;

        const int& v1 = cell.get_or_init([&]() { ++calls; return 10; });
        assert(v1 == 10);
        assert(calls == 1);

        const int& v2 = cell.get_or_init([&]() { ++calls; return 20; });
        assert(v2 == 10);
        assert(calls == 1);  // not called again
        assert(&v1 == &v2);
    }
    printf("PASS\n");
}

void test_get_or_init_recursive() {
    printf("test_get_or_init_recursive: ");
    {
        OptionCell<int> cell;
        bool threw = false;
        try {
            (void)cell.get_or_init([&]() {
                cell.set(1).unwrap();
                return 2;
            });
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
        // The value stored by the inner set() wins
        assert(cell.get().unwrap() == 1);
    }
    printf("PASS\n");
}

void test_from_into_option_round_trip() {
    printf("test_from_into_option_round_trip: ");
    {
        Option<int> some = Some(5);
        Option<int> none = None;

        assert(OptionCell<int>::from(some).into_option() == some);
        assert(OptionCell<int>::from(none).into_option() == none);

        OptionCell<std::string> cell(Some(std::string("owned")));
        assert(cell.is_filled());
        Option<std::string> back = std::move(cell).into_option();
        assert(back.is_some());
        assert(back.unwrap() == "owned");
    }
    printf("PASS\n");
}

void test_from_consumes_source() {
    printf("test_from_consumes_source: ");
    {
        Option<std::vector<int>> opt = Some(std::vector<int>{1, 2, 3});
        auto cell = OptionCell<std::vector<int>>::from(std::move(opt));
        assert(opt.is_none());
        assert(cell.get().unwrap().size() == 3);
    }
    printf("PASS\n");
}

void test_no_double_destruction() {
    printf("test_no_double_destruction: ");
    {
        Tracked::drops = 0;
        {
            OptionCell<Tracked> cell;
            cell.set(Tracked(1)).unwrap();
            assert(Tracked::drops == 0);

            Option<Tracked> out = std::move(cell).into_option();
            assert(Tracked::drops == 0);
            assert(out.is_some());
        }
        assert(Tracked::drops == 1);

        Tracked::drops = 0;
        {
            OptionCell<Tracked> cell;
            cell.set(Tracked(1)).unwrap();
            {
                auto result = cell.set(Tracked(2));
                assert(result.is_err());
            }
            // Only the rejected value has been dropped so far
            assert(Tracked::drops == 1);
        }
        assert(Tracked::drops == 2);

        Tracked::drops = 0;
        {
            OptionCell<Tracked> empty;
        }
        assert(Tracked::drops == 0);
    }
    printf("PASS\n");
}

void test_clone_and_equality() {
    printf("test_clone_and_equality: ");
    {
        OptionCell<std::string> a;
        a.set(std::string("x")).unwrap();

        OptionCell<std::string> b(a);
        assert(b.get().unwrap() == "x");
        assert(&b.get().unwrap() != &a.get().unwrap());
        assert(a == b);

        OptionCell<std::string> c;
        assert(a != c);
        assert(c == OptionCell<std::string>());
    }
    printf("PASS\n");
}

void test_move_construct() {
    printf("test_move_construct: ");
    {
        Tracked::drops = 0;
        {
            OptionCell<Tracked> a;
            a.set(Tracked(3)).unwrap();
            OptionCell<Tracked> b(std::move(a));
            assert(b.get().unwrap().value == 3);
            assert(Tracked::drops == 0);
        }
        assert(Tracked::drops == 1);
    }
    printf("PASS\n");
}

void test_queries_do_not_mutate() {
    printf("test_queries_do_not_mutate: ");
    {
        OptionCell<int> cell;
        cell.set(99).unwrap();

        unsigned char before[sizeof(cell)];
        std::memcpy(before, &cell, sizeof(cell));

        for (int i = 0; i < 10; ++i) {
            assert(cell.is_filled());
            assert(!cell.is_empty());
            assert(cell.get().unwrap() == 99);
            assert(cell.try_get().is_ok());
        }

        unsigned char after[sizeof(cell)];
        std::memcpy(after, &cell, sizeof(cell));
        assert(std::memcmp(before, after, sizeof(cell)) == 0);

        OptionCell<int> empty;
        for (int i = 0; i < 10; ++i) {
            assert(empty.is_empty());
            assert(empty.get().is_none());
        }
        assert(empty.is_empty());
    }
    printf("PASS\n");
}

void test_non_null_payload() {
    printf("test_non_null_payload: ");
    {
        int x = 5;
        int y = 6;
        OptionCell<NonNull<int>> cell;
        assert(cell.is_empty());

        cell.set(NonNull<int>::from_ref(x)).unwrap();
        assert(cell.get().unwrap().as_ptr() == &x);

        auto result = cell.set(NonNull<int>::from_ref(y));
        assert(result.is_err());
        assert(result.unwrap_err().value.as_ptr() == &y);
        assert(cell.get().unwrap().as_ref() == 5);
    }
    printf("PASS\n");
}

int main() {
    printf("Running OptionCell tests...\n");

    test_new_get();
    test_set_get();
    test_set_rejected();
    test_set_rejected_returns_move_only_value();
    test_reference_stays_valid();
    test_const_cell();
    test_get_or_init();
    test_get_or_init_recursive();
    test_from_into_option_round_trip();
    test_from_consumes_source();
    test_no_double_destruction();
    test_clone_and_equality();
    test_move_construct();
    test_queries_do_not_mutate();
    test_non_null_payload();

    printf("All OptionCell tests passed!\n");
    return 0;
}
