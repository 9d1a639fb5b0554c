#pragma once

#include <string>

std::string nowStr();     // 2024-05-01 13:45:10, para console e CSV
std::string nowMailDateStr();  // Wed, 01 May 2024 13:45:10 -0300 (RFC 5322), cabeçalho Date do email
