/**
 * @file records.hpp
 * @brief Record types shared by the test suites
 */

#ifndef STRUCTMERGE_TESTS_RECORDS_HPP
#define STRUCTMERGE_TESTS_RECORDS_HPP

#include "structmerge/Describe.hpp"
#include <any>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fixtures {

using structmerge::RecordBuilder;
using structmerge::SourceRef;

struct Address {
    std::string street;
    std::string city;
    std::string country;
};

inline bool operator==(const Address& a, const Address& b) {
    return a.street == b.street && a.city == b.city && a.country == b.country;
}

inline void describe(RecordBuilder<Address>& r) {
    r.name("Address")
     .field("Street", &Address::street)
     .field("City", &Address::city)
     .field("Country", &Address::country);
}

/**
 * @brief Flat and nested fields plus one private field
 */
class Account {
public:
    std::string name;
    int age = 0;
    Address address;
    bool active = false;
    unsigned count = 0;

    const std::string& hidden() const { return hidden_; }
    void set_hidden(std::string value) { hidden_ = std::move(value); }

private:
    std::string hidden_;

    friend void describe(RecordBuilder<Account>& r) {
        r.name("Account")
         .field("Name", &Account::name)
         .field("Age", &Account::age)
         .field("Address", &Account::address)
         .field("Active", &Account::active)
         .field("Count", &Account::count)
         .readonly("hidden", &Account::hidden_);
    }
};

inline bool operator==(const Account& a, const Account& b) {
    return a.name == b.name && a.age == b.age && a.address == b.address &&
           a.active == b.active && a.count == b.count && a.hidden() == b.hidden();
}

struct Person {
    std::string name;
    int age = 0;
    std::shared_ptr<Address> address;
    bool active = false;
};

inline void describe(RecordBuilder<Person>& r) {
    r.name("Person")
     .field("Name", &Person::name)
     .field("Age", &Person::age)
     .field("Address", &Person::address)
     .field("Active", &Person::active);
}

struct Owner {
    std::string name;
    std::unique_ptr<Address> address;
};

inline void describe(RecordBuilder<Owner>& r) {
    r.name("Owner")
     .field("Name", &Owner::name)
     .field("Address", &Owner::address);
}

struct Floats {
    float value = 0.0f;
    double value2 = 0.0;
};

inline void describe(RecordBuilder<Floats>& r) {
    r.field("Value", &Floats::value).field("Value2", &Floats::value2);
}

/**
 * @brief Timestamp wrapper merged only through merge_from
 */
struct Date {
    std::chrono::system_clock::time_point when;
    int merges = 0;

    void merge_from(const SourceRef& src) {
        when = src.get<Date>().when;
        ++merges;
    }
};

struct Plan {
    Date date;
    std::vector<std::uint8_t> data;
};

inline void describe(RecordBuilder<Plan>& r) {
    r.name("Plan").field("Date", &Plan::date).field("Data", &Plan::data);
}

/**
 * @brief Custom merge that rejects negative values
 */
struct Guarded {
    int value = 0;

    void merge_from(const SourceRef& src) {
        const Guarded& other = src.get<Guarded>();
        if (other.value < 0) {
            throw std::runtime_error("negative value rejected");
        }
        value = other.value;
    }
};

struct Holder {
    std::string before;
    Guarded guarded;
    std::string after;
};

inline void describe(RecordBuilder<Holder>& r) {
    r.name("Holder")
     .field("Before", &Holder::before)
     .field("Guarded", &Holder::guarded)
     .field("After", &Holder::after);
}

/**
 * @brief Custom merge that only takes the label when the source has one
 */
struct Label {
    std::string text;
    std::string note;

    void merge_from(const SourceRef& src) {
        const Label& other = src.get<Label>();
        if (!other.text.empty()) {
            text = other.text + "!";
        }
    }
};

inline void describe(RecordBuilder<Label>& r) {
    r.field("Text", &Label::text).field("Note", &Label::note);
}

struct Event {
    std::string title;
    std::chrono::system_clock::time_point at;
};

inline void describe(RecordBuilder<Event>& r) {
    r.name("Event").field("Title", &Event::title).field("At", &Event::at);
}

/**
 * @brief Described record copied wholesale
 */
struct Coordinates {
    double lat = 0.0;
    double lon = 0.0;
};

inline void describe(RecordBuilder<Coordinates>& r) {
    r.name("Coordinates").field("Lat", &Coordinates::lat).field("Lon", &Coordinates::lon).atomic();
}

struct Place {
    std::string name;
    Coordinates where;
};

inline void describe(RecordBuilder<Place>& r) {
    r.name("Place").field("Name", &Place::name).field("Where", &Place::where);
}

enum class Color : std::uint8_t { None = 0, Red = 1, Blue = 2 };

/**
 * @brief Not described: opaque leaf
 */
struct Blob {
    int bytes = 0;
};

/**
 * @brief One field per category
 */
struct Everything {
    bool flag = false;
    int number = 0;
    std::uint64_t unsigned_number = 0;
    double ratio = 0.0;
    std::string text;
    std::vector<int> items;
    std::map<std::string, int> table;
    std::optional<int> maybe;
    std::shared_ptr<int> shared;
    std::any anything;
    Color color = Color::None;
    Blob blob;
};

inline void describe(RecordBuilder<Everything>& r) {
    r.name("Everything")
     .field("Flag", &Everything::flag)
     .field("Number", &Everything::number)
     .field("UnsignedNumber", &Everything::unsigned_number)
     .field("Ratio", &Everything::ratio)
     .field("Text", &Everything::text)
     .field("Items", &Everything::items)
     .field("Table", &Everything::table)
     .field("Maybe", &Everything::maybe)
     .field("Shared", &Everything::shared)
     .field("Anything", &Everything::anything)
     .field("Color", &Everything::color)
     .field("Blob", &Everything::blob);
}

/**
 * @brief Reaches itself only through an indirection
 */
struct Node {
    int value = 0;
    std::shared_ptr<Node> next;
};

inline void describe(RecordBuilder<Node>& r) {
    r.name("Node").field("Value", &Node::value).field("Next", &Node::next);
}

struct Other {
    std::string foo;
};

inline void describe(RecordBuilder<Other>& r) {
    r.name("Other").field("Foo", &Other::foo);
}

/**
 * @brief Built-in fixed-size arrays
 */
struct Codes {
    int values[3] = {0, 0, 0};
    char tag[4] = {};
    int grid[2][2] = {};
};

inline void describe(RecordBuilder<Codes>& r) {
    r.name("Codes")
     .field("Values", &Codes::values)
     .field("Tag", &Codes::tag)
     .field("Grid", &Codes::grid);
}

// No default constructor.
struct Ticket {
    std::string code;
    int seat;

    Ticket(std::string c, int s) : code(std::move(c)), seat(s) {}
};

inline void describe(RecordBuilder<Ticket>& r) {
    r.name("Ticket").field("Code", &Ticket::code).field("Seat", &Ticket::seat);
}

} // namespace fixtures

#endif // STRUCTMERGE_TESTS_RECORDS_HPP
