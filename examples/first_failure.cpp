// Copyright 2022 Anthony Paul Astolfi
//
#include <ffail.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

ffail::Result<int, std::string> parse_int(const std::string& s)
{
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return ffail::failure("not a number: '" + s + "'");
    }
    try {
        return ffail::success(std::stoi(s));
    } catch (const std::out_of_range&) {
        return ffail::failure("out of range: '" + s + "'");
    }
}

ffail::Result<int, std::string> total(const std::vector<std::string>& fields)
{
    return ffail::as_seq(fields)            //
           | ffail::seq::map(&parse_int)    //
           | ffail::seq::first_failure_or_else([](auto& numbers) {
                 return ffail::as_ref(numbers) | ffail::seq::sum();
             });
}

}  // namespace

int main()
{
    FFAIL_CHECK_EQ(total({"1", "2", "3"}), ffail::success(6));
    FFAIL_CHECK_EQ(total({"1", "two", "3", "four"}), ffail::failure(std::string{"not a number: 'two'"}));
    FFAIL_CHECK_EQ(total({}), ffail::success(0));
    FFAIL_CHECK_EQ(total({"1", "99999999999", "2"}), ffail::failure(std::string{"out of range: '99999999999'"}));

    return 0;
}
