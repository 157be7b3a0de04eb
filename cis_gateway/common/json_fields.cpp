#include "json_fields.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace cis {

static bool value_pos(const std::string& s, const std::string& key, size_t& pos){
  pos = s.find("\""+key+"\"");
  if(pos==std::string::npos) return false;
  pos = s.find(":", pos+key.size()+2);
  if(pos==std::string::npos) return false;
  pos++;
  while(pos<s.size() && std::isspace((unsigned char)s[pos])) pos++;
  return pos<s.size();
}

bool json_number(const std::string& s, const std::string& key, double& out){
  size_t pos=0;
  if(!value_pos(s,key,pos)) return false;
  size_t end=pos;
  while(end<s.size() && (std::isdigit((unsigned char)s[end]) || s[end]=='.' || s[end]=='-' || s[end]=='e' || s[end]=='E' || s[end]=='+')) end++;
  if(end==pos) return false;
  char* stop=nullptr;
  std::string tok = s.substr(pos, end-pos);
  double d = std::strtod(tok.c_str(), &stop);
  if(stop==tok.c_str() || !std::isfinite(d)) return false;
  out = d;
  return true;
}

bool json_int(const std::string& s, const std::string& key, int& out){
  double d=0; if(!json_number(s,key,d)) return false;
  out = (int)d; return true;
}

bool json_bool(const std::string& s, const std::string& key, bool& out){
  size_t pos=0;
  if(!value_pos(s,key,pos)) return false;
  if(s.compare(pos,4,"true")==0){ out=true; return true; }
  if(s.compare(pos,5,"false")==0){ out=false; return true; }
  return false;
}

bool json_string(const std::string& s, const std::string& key, std::string& out){
  size_t pos=0;
  if(!value_pos(s,key,pos)) return false;
  if(s[pos]!='"') return false;
  pos++;
  std::string v;
  for(; pos<s.size(); pos++){
    char c=s[pos];
    if(c=='"'){ out=v; return true; }
    if(c=='\\' && pos+1<s.size()){
      char n=s[++pos];
      switch(n){
        case 'n': v+='\n'; break;
        case 't': v+='\t'; break;
        case 'r': v+='\r'; break;
        default:  v+=n; break;
      }
      continue;
    }
    v+=c;
  }
  return false;
}

bool json_objects(const std::string& s, const std::string& key, std::vector<std::string>& out){
  size_t pos=0;
  if(!value_pos(s,key,pos)) return false;
  if(s[pos]!='[') return false;
  out.clear();
  int depth=0; size_t start=0; bool in_str=false;
  for(size_t i=pos+1; i<s.size(); i++){
    char c=s[i];
    if(in_str){
      if(c=='\\'){ i++; continue; }
      if(c=='"') in_str=false;
      continue;
    }
    if(c=='"'){ in_str=true; continue; }
    if(c=='{'){ if(depth==0) start=i; depth++; }
    else if(c=='}'){
      depth--;
      if(depth<0) return false;
      if(depth==0) out.push_back(s.substr(start, i-start+1));
    }
    else if(c==']' && depth==0) return true;
  }
  return false; // unterminated
}

std::string json_escape(const std::string& s){
  std::string o; o.reserve(s.size()+2);
  for(char c : s){
    switch(c){
      case '"':  o+="\\\""; break;
      case '\\': o+="\\\\"; break;
      case '\n': o+="\\n"; break;
      case '\r': o+="\\r"; break;
      case '\t': o+="\\t"; break;
      default:
        if((unsigned char)c<0x20){
          char b[8]; std::snprintf(b,sizeof(b),"\\u%04x",(unsigned)(unsigned char)c); o+=b;
        } else o+=c;
    }
  }
  return o;
}

std::string format_number(double v){
  if(!std::isfinite(v)) return "null";
  char b[32]; std::snprintf(b,sizeof(b),"%.10g",v);
  return b;
}

void JsonWriter::key(const char* k){
  if(!first_) buf_+=",";
  first_=false;
  buf_+="\""; buf_+=json_escape(k); buf_+="\":";
}

JsonWriter& JsonWriter::num(const char* k, double v){
  key(k); buf_+=format_number(v); return *this;
}

JsonWriter& JsonWriter::integer(const char* k, long long v){
  key(k); buf_+=std::to_string(v); return *this;
}

JsonWriter& JsonWriter::boolean(const char* k, bool v){
  key(k); buf_+= v ? "true" : "false"; return *this;
}

JsonWriter& JsonWriter::str(const char* k, const std::string& v){
  key(k); buf_+="\""; buf_+=json_escape(v); buf_+="\""; return *this;
}

JsonWriter& JsonWriter::raw(const char* k, const std::string& json){
  key(k); buf_+=json; return *this;
}

} // namespace cis
