#pragma once

#include <catch2/catch.hpp>

#include <tokenledger/AccountId.hpp>
#include <tokenledger/Balance.hpp>

#include <string>

template <>
struct Catch::StringMaker<tokenledger::Balance>
{
   static std::string convert(tokenledger::Balance value)
   {
      return tokenledger::balanceToString(value);
   }
};

template <>
struct Catch::StringMaker<tokenledger::AccountId>
{
   static std::string convert(const tokenledger::AccountId& account) { return account.str(); }
};
