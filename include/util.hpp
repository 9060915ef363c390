#pragma once
#include "clipshare_common.hpp"

#include <string>
#include <vector>

// ---------- SessionID ----------
std::string generate_session_id();

// ---------- Helpers: input validation ----------
bool is_valid_utf8(const byte* p, size_t len);
bool is_valid_utf8(const std::string& s);
bool is_all_digits(const std::string& s);

// Parses a decimal TCP/UDP port (0..65535)
bool parse_port(const std::string& s, uint16_t& out);

// ---------- Big-endian length field ----------
void put_u64_be(uint64_t v, byte out[8]);
uint64_t get_u64_be(const byte in[8]);

// ---------- Misc ----------
std::string errno_str(int err);
