#pragma once

namespace DS
{

constexpr double PI = 3.14159265358979323846;
constexpr float PI_F = float( PI );
constexpr float PI2_F = float( PI / 2 );

} //namespace DS
