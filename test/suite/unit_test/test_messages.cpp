/* Arena-PB: Zero-Copy Protobuf Wire Codec
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#include "test_messages.hpp"

namespace arenapb::test
{

// Address implementations.

size_t Address_view::encoded_len() const
{
  return codec::String::encoded_len_implicit(1, m_city) + codec::Uint32::encoded_len_implicit(2, m_zip);
}

void Address_view::encode_raw(wire::Wire_writer* out) const
{
  codec::String::encode_implicit(1, m_city, out);
  codec::Uint32::encode_implicit(2, m_zip, out);
}

Address_builder::Address_builder(Arena* arena) :
  Base(arena),
  m_zip(0)
{
  // Yay.
}

void Address_builder::set_city(util::String_view city)
{
  ensure_mutable();
  m_city = arena()->allocate_str(city);
}

void Address_builder::set_zip(uint32_t zip)
{
  ensure_mutable();
  m_zip = zip;
}

bool Address_builder::merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
                                  Decode_context, Error_code* err_code)
{
  switch (field_number)
  {
  case 1:
    codec::String::merge(wire_type, &m_city, arena(), in, err_code);
    return true;
  case 2:
    codec::Uint32::merge(wire_type, &m_zip, in, err_code);
    return true;
  default:
    return false;
  }
}

Address_view Address_builder::freeze_fields()
{
  Address_view view;
  view.m_city = m_city;
  view.m_zip = m_zip;
  return view;
}

// Person implementations.

size_t Person_view::encoded_len() const
{
  return codec::String::encoded_len_implicit(1, m_name)
         + codec::Int32::encoded_len_implicit(2, m_age)
         + codec::Int32::encoded_len_explicit(3, m_lucky_number)
         + codec::String::encoded_len_repeated(4, m_emails)
         + codec::Message<Address_view>::encoded_len_optional(5, m_address)
         + codec::Int32::encoded_len_packed(6, m_scores)
         + codec::Sint64::encoded_len_repeated(7, m_deltas)
         + codec::Bytes::encoded_len_implicit(8, m_avatar)
         + codec::Double::encoded_len_implicit(9, m_balance)
         + codec::Bool::encoded_len_implicit(10, m_verified)
         + codec::Fixed32::encoded_len_implicit(11, m_checksum)
         + codec::Enum::encoded_len_implicit(12, m_status);
}

void Person_view::encode_raw(wire::Wire_writer* out) const
{
  codec::String::encode_implicit(1, m_name, out);
  codec::Int32::encode_implicit(2, m_age, out);
  codec::Int32::encode_explicit(3, m_lucky_number, out);
  codec::String::encode_repeated(4, m_emails, out);
  codec::Message<Address_view>::encode_optional(5, m_address, out);
  codec::Int32::encode_packed(6, m_scores, out);
  codec::Sint64::encode_repeated(7, m_deltas, out);
  codec::Bytes::encode_implicit(8, m_avatar, out);
  codec::Double::encode_implicit(9, m_balance, out);
  codec::Bool::encode_implicit(10, m_verified, out);
  codec::Fixed32::encode_implicit(11, m_checksum, out);
  codec::Enum::encode_implicit(12, m_status, out);
}

Person_builder::Person_builder(Arena* arena) :
  Base(arena),
  m_age(0),
  m_emails(arena),
  m_address(nullptr),
  m_scores(arena),
  m_deltas(arena),
  m_balance(0),
  m_verified(false),
  m_checksum(0),
  m_status(0)
{
  // Yay.
}

void Person_builder::set_name(util::String_view name)
{
  ensure_mutable();
  m_name = arena()->allocate_str(name);
}

void Person_builder::set_age(int32_t age)
{
  ensure_mutable();
  m_age = age;
}

void Person_builder::set_lucky_number(std::optional<int32_t> lucky_number)
{
  ensure_mutable();
  m_lucky_number = lucky_number;
}

void Person_builder::push_emails(util::String_view email)
{
  ensure_mutable();
  m_emails.push_back(arena()->allocate_str(email));
}

void Person_builder::set_address(const Address_view& address)
{
  ensure_mutable();
  m_address = arena()->construct<Address_view>(address);
}

void Person_builder::push_scores(int32_t score)
{
  ensure_mutable();
  m_scores.push_back(score);
}

void Person_builder::push_deltas(int64_t delta)
{
  ensure_mutable();
  m_deltas.push_back(delta);
}

void Person_builder::set_avatar(util::Blob_const avatar)
{
  ensure_mutable();
  m_avatar = arena()->allocate_bytes(avatar);
}

void Person_builder::set_balance(double balance)
{
  ensure_mutable();
  m_balance = balance;
}

void Person_builder::set_verified(bool verified)
{
  ensure_mutable();
  m_verified = verified;
}

void Person_builder::set_checksum(uint32_t checksum)
{
  ensure_mutable();
  m_checksum = checksum;
}

void Person_builder::set_status(Status status)
{
  ensure_mutable();
  m_status = static_cast<int32_t>(status);
}

util::String_view Person_builder::get_name() const
{
  return m_name;
}

int32_t Person_builder::get_age() const
{
  return m_age;
}

std::optional<int32_t> Person_builder::get_lucky_number() const
{
  return m_lucky_number;
}

Slice<util::String_view> Person_builder::get_emails() const
{
  return m_emails.freeze();
}

const Address_view* Person_builder::get_address() const
{
  return m_address;
}

Slice<int32_t> Person_builder::get_scores() const
{
  return m_scores.freeze();
}

Slice<int64_t> Person_builder::get_deltas() const
{
  return m_deltas.freeze();
}

Bytes Person_builder::get_avatar() const
{
  return m_avatar;
}

double Person_builder::get_balance() const
{
  return m_balance;
}

bool Person_builder::get_verified() const
{
  return m_verified;
}

uint32_t Person_builder::get_checksum() const
{
  return m_checksum;
}

int32_t Person_builder::get_status() const
{
  return m_status;
}

bool Person_builder::merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
                                 Decode_context ctx, Error_code* err_code)
{
  switch (field_number)
  {
  case 1:
    codec::String::merge(wire_type, &m_name, arena(), in, err_code);
    return true;
  case 2:
    codec::Int32::merge(wire_type, &m_age, in, err_code);
    return true;
  case 3:
    codec::Int32::merge_explicit(wire_type, &m_lucky_number, in, err_code);
    return true;
  case 4:
    codec::String::merge_repeated(wire_type, &m_emails, arena(), in, err_code);
    return true;
  case 5:
    codec::Message<Address_view>::merge_optional(wire_type, &m_address, arena(), in, ctx, err_code);
    return true;
  case 6:
    codec::Int32::merge_repeated(wire_type, &m_scores, in, err_code);
    return true;
  case 7:
    codec::Sint64::merge_repeated(wire_type, &m_deltas, in, err_code);
    return true;
  case 8:
    codec::Bytes::merge(wire_type, &m_avatar, arena(), in, err_code);
    return true;
  case 9:
    codec::Double::merge(wire_type, &m_balance, in, err_code);
    return true;
  case 10:
    codec::Bool::merge(wire_type, &m_verified, in, err_code);
    return true;
  case 11:
    codec::Fixed32::merge(wire_type, &m_checksum, in, err_code);
    return true;
  case 12:
    codec::Enum::merge(wire_type, &m_status, in, err_code);
    return true;
  default:
    return false;
  }
} // Person_builder::merge_field()

Person_view Person_builder::freeze_fields()
{
  Person_view view;
  view.m_name = m_name;
  view.m_age = m_age;
  view.m_lucky_number = m_lucky_number;
  view.m_emails = m_emails.freeze();
  view.m_address = m_address;
  view.m_scores = m_scores.freeze();
  view.m_deltas = m_deltas.freeze();
  view.m_avatar = m_avatar;
  view.m_balance = m_balance;
  view.m_verified = m_verified;
  view.m_checksum = m_checksum;
  view.m_status = m_status;
  return view;
}

// Person_lite implementations.

size_t Person_lite_view::encoded_len() const
{
  return codec::String::encoded_len_implicit(1, m_name) + codec::Int32::encoded_len_implicit(2, m_age);
}

void Person_lite_view::encode_raw(wire::Wire_writer* out) const
{
  codec::String::encode_implicit(1, m_name, out);
  codec::Int32::encode_implicit(2, m_age, out);
}

Person_lite_builder::Person_lite_builder(Arena* arena) :
  Base(arena),
  m_age(0)
{
  // Yay.
}

bool Person_lite_builder::merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
                                      Decode_context, Error_code* err_code)
{
  switch (field_number)
  {
  case 1:
    codec::String::merge(wire_type, &m_name, arena(), in, err_code);
    return true;
  case 2:
    codec::Int32::merge(wire_type, &m_age, in, err_code);
    return true;
  default:
    return false;
  }
}

Person_lite_view Person_lite_builder::freeze_fields()
{
  Person_lite_view view;
  view.m_name = m_name;
  view.m_age = m_age;
  return view;
}

// Image implementations.

size_t Image_view::encoded_len() const
{
  return codec::String::encoded_len_implicit(1, m_url) + codec::Uint32::encoded_len_implicit(2, m_width);
}

void Image_view::encode_raw(wire::Wire_writer* out) const
{
  codec::String::encode_implicit(1, m_url, out);
  codec::Uint32::encode_implicit(2, m_width, out);
}

Image_builder::Image_builder(Arena* arena) :
  Base(arena),
  m_width(0)
{
  // Yay.
}

void Image_builder::set_url(util::String_view url)
{
  ensure_mutable();
  m_url = arena()->allocate_str(url);
}

void Image_builder::set_width(uint32_t width)
{
  ensure_mutable();
  m_width = width;
}

bool Image_builder::merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
                                Decode_context, Error_code* err_code)
{
  switch (field_number)
  {
  case 1:
    codec::String::merge(wire_type, &m_url, arena(), in, err_code);
    return true;
  case 2:
    codec::Uint32::merge(wire_type, &m_width, in, err_code);
    return true;
  default:
    return false;
  }
}

Image_view Image_builder::freeze_fields()
{
  Image_view view;
  view.m_url = m_url;
  view.m_width = m_width;
  return view;
}

// Notification implementations.

size_t Notification_view::encoded_len() const
{
  size_t len = 0;
  if (const auto text = std::get_if<util::String_view>(&m_content))
  {
    len += codec::String::encoded_len(1, *text);
  }
  else if (const auto image = std::get_if<const Image_view*>(&m_content))
  {
    len += codec::Message<Image_view>::encoded_len(2, **image);
  }
  else if (const auto code = std::get_if<int32_t>(&m_content))
  {
    len += codec::Int32::encoded_len(3, *code);
  }
  return len + codec::Uint64::encoded_len_implicit(4, m_id);
}

void Notification_view::encode_raw(wire::Wire_writer* out) const
{
  // A set oneof member is always written, even if it holds its default value.
  if (const auto text = std::get_if<util::String_view>(&m_content))
  {
    codec::String::encode(1, *text, out);
  }
  else if (const auto image = std::get_if<const Image_view*>(&m_content))
  {
    codec::Message<Image_view>::encode(2, **image, out);
  }
  else if (const auto code = std::get_if<int32_t>(&m_content))
  {
    codec::Int32::encode(3, *code, out);
  }
  codec::Uint64::encode_implicit(4, m_id, out);
}

Notification_builder::Notification_builder(Arena* arena) :
  Base(arena),
  m_id(0)
{
  // Yay.
}

void Notification_builder::set_text(util::String_view text)
{
  ensure_mutable();
  m_content = arena()->allocate_str(text);
}

void Notification_builder::set_image(const Image_view& image)
{
  ensure_mutable();
  m_content = static_cast<const Image_view*>(arena()->construct<Image_view>(image));
}

void Notification_builder::set_code(int32_t code)
{
  ensure_mutable();
  m_content = code;
}

void Notification_builder::set_id(uint64_t id)
{
  ensure_mutable();
  m_id = id;
}

bool Notification_builder::merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
                                       Decode_context ctx, Error_code* err_code)
{
  switch (field_number)
  {
  case 1:
  {
    util::String_view text;
    codec::String::merge(wire_type, &text, arena(), in, err_code);
    if (!*err_code)
    {
      m_content = text;
    }
    return true;
  }
  case 2:
  {
    const Image_view* image = nullptr;
    codec::Message<Image_view>::merge_optional(wire_type, &image, arena(), in, ctx, err_code);
    if (!*err_code)
    {
      m_content = image;
    }
    return true;
  }
  case 3:
  {
    int32_t code = 0;
    codec::Int32::merge(wire_type, &code, in, err_code);
    if (!*err_code)
    {
      m_content = code;
    }
    return true;
  }
  case 4:
    codec::Uint64::merge(wire_type, &m_id, in, err_code);
    return true;
  default:
    return false;
  }
} // Notification_builder::merge_field()

Notification_view Notification_builder::freeze_fields()
{
  Notification_view view;
  view.m_content = m_content;
  view.m_id = m_id;
  return view;
}

// User_profile implementations.

size_t User_profile_view::encoded_len() const
{
  return Attributes_codec::encoded_len(1, m_attributes)
         + Names_by_id_codec::encoded_len(2, m_names_by_id)
         + Addresses_codec::encoded_len(3, m_addresses);
}

void User_profile_view::encode_raw(wire::Wire_writer* out) const
{
  Attributes_codec::encode(1, m_attributes, out);
  Names_by_id_codec::encode(2, m_names_by_id, out);
  Addresses_codec::encode(3, m_addresses, out);
}

User_profile_builder::User_profile_builder(Arena* arena) :
  Base(arena),
  m_attributes(arena),
  m_names_by_id(arena),
  m_addresses(arena)
{
  // Yay.
}

void User_profile_builder::put_attribute(util::String_view key, util::String_view value)
{
  ensure_mutable();
  m_attributes.push_back({ arena()->allocate_str(key), arena()->allocate_str(value) });
}

void User_profile_builder::put_name_by_id(int32_t key, util::String_view value)
{
  ensure_mutable();
  m_names_by_id.push_back({ key, arena()->allocate_str(value) });
}

void User_profile_builder::put_address(util::String_view key, const Address_view& value)
{
  ensure_mutable();
  m_addresses.push_back({ arena()->allocate_str(key), arena()->construct<Address_view>(value) });
}

bool User_profile_builder::merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
                                       Decode_context ctx, Error_code* err_code)
{
  switch (field_number)
  {
  case 1:
    User_profile_view::Attributes_codec::merge(wire_type, &m_attributes, arena(), in, ctx, err_code);
    return true;
  case 2:
    User_profile_view::Names_by_id_codec::merge(wire_type, &m_names_by_id, arena(), in, ctx, err_code);
    return true;
  case 3:
    User_profile_view::Addresses_codec::merge(wire_type, &m_addresses, arena(), in, ctx, err_code);
    return true;
  default:
    return false;
  }
}

User_profile_view User_profile_builder::freeze_fields()
{
  User_profile_view view;
  view.m_attributes = User_profile_view::Attributes_codec::Map_type::build(&m_attributes);
  view.m_names_by_id = User_profile_view::Names_by_id_codec::Map_type::build(&m_names_by_id);
  view.m_addresses = User_profile_view::Addresses_codec::Map_type::build(&m_addresses);
  return view;
}

// Node implementations.

size_t Node_view::encoded_len() const
{
  return codec::Int32::encoded_len_implicit(1, m_value) + codec::Message<Node_view>::encoded_len_optional(2, m_child);
}

void Node_view::encode_raw(wire::Wire_writer* out) const
{
  codec::Int32::encode_implicit(1, m_value, out);
  codec::Message<Node_view>::encode_optional(2, m_child, out);
}

Node_builder::Node_builder(Arena* arena) :
  Base(arena),
  m_value(0),
  m_child(nullptr)
{
  // Yay.
}

void Node_builder::set_value(int32_t value)
{
  ensure_mutable();
  m_value = value;
}

void Node_builder::set_child(const Node_view& child)
{
  ensure_mutable();
  m_child = arena()->construct<Node_view>(child);
}

bool Node_builder::merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
                               Decode_context ctx, Error_code* err_code)
{
  switch (field_number)
  {
  case 1:
    codec::Int32::merge(wire_type, &m_value, in, err_code);
    return true;
  case 2:
    codec::Message<Node_view>::merge_optional(wire_type, &m_child, arena(), in, ctx, err_code);
    return true;
  default:
    return false;
  }
}

Node_view Node_builder::freeze_fields()
{
  Node_view view;
  view.m_value = m_value;
  view.m_child = m_child;
  return view;
}

// Header implementations.

size_t Header_view::encoded_len() const
{
  return codec::Int32::encoded_len_implicit(2, m_id);
}

void Header_view::encode_raw(wire::Wire_writer* out) const
{
  codec::Int32::encode_implicit(2, m_id, out);
}

Header_builder::Header_builder(Arena* arena) :
  Base(arena),
  m_id(0)
{
  // Yay.
}

void Header_builder::set_id(int32_t id)
{
  ensure_mutable();
  m_id = id;
}

bool Header_builder::merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
                                 Decode_context, Error_code* err_code)
{
  if (field_number != 2)
  {
    return false;
  }
  // else
  codec::Int32::merge(wire_type, &m_id, in, err_code);
  return true;
}

Header_view Header_builder::freeze_fields()
{
  Header_view view;
  view.m_id = m_id;
  return view;
}

// Legacy implementations.

size_t Legacy_view::encoded_len() const
{
  return codec::Group<Header_view>::encoded_len_optional(1, m_header) + codec::String::encoded_len_implicit(3, m_note);
}

void Legacy_view::encode_raw(wire::Wire_writer* out) const
{
  codec::Group<Header_view>::encode_optional(1, m_header, out);
  codec::String::encode_implicit(3, m_note, out);
}

Legacy_builder::Legacy_builder(Arena* arena) :
  Base(arena),
  m_header(nullptr)
{
  // Yay.
}

void Legacy_builder::set_header(const Header_view& header)
{
  ensure_mutable();
  m_header = arena()->construct<Header_view>(header);
}

void Legacy_builder::set_note(util::String_view note)
{
  ensure_mutable();
  m_note = arena()->allocate_str(note);
}

bool Legacy_builder::merge_field(uint32_t field_number, wire::Wire_type wire_type, wire::Wire_reader* in,
                                 Decode_context ctx, Error_code* err_code)
{
  switch (field_number)
  {
  case 1:
    codec::Group<Header_view>::merge_optional(1, wire_type, &m_header, arena(), in, ctx, err_code);
    return true;
  case 3:
    codec::String::merge(wire_type, &m_note, arena(), in, err_code);
    return true;
  default:
    return false;
  }
}

Legacy_view Legacy_builder::freeze_fields()
{
  Legacy_view view;
  view.m_header = m_header;
  view.m_note = m_note;
  return view;
}

// Free function implementations.

std::string nested_nodes(size_t depth)
{
  const std::string leaf("\x08\x01", 2); // value = 1.
  std::string body = leaf;
  for (size_t level = 0; level != depth; ++level)
  {
    std::string outer = leaf;
    outer += '\x12'; // child: field 2, length-delimited.
    for (size_t len = body.size(); ; len >>= 7)
    {
      if (len < 0x80)
      {
        outer += char(len);
        break;
      }
      outer += char((len & 0x7F) | 0x80);
    }
    outer += body;
    body = std::move(outer);
  }
  return body;
}

util::Blob_const as_blob(const std::string& str)
{
  return util::Blob_const(str.data(), str.size());
}

} // namespace arenapb::test
